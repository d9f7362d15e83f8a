#ifndef SLU_TAGGER_H
#define SLU_TAGGER_H

#include "batch.h"
#include "crf.h"
#include "encoder.h"
#include "linear.h"
#include "loss.h"
#include "vocabulary.h"
#include <memory>
#include <vector>

/**
 * @brief Result of one tagger forward pass
 */
struct TaggerOutput {
    EncoderOutput encoded;
    std::vector<Matrix> emissions;  // per timestep (batch × num_tags)
};

/**
 * @brief Slot tagger: shared encoder → hidden-to-tag projection → CRF or softmax
 *
 * The softmax path scores every token independently and ignores padding via
 * a zero weight on the "<pad>" tag; the CRF path scores whole sequences
 * under the batch mask.
 */
class SlotTagger {
private:
    std::unique_ptr<SequenceEncoder> encoder;
    Linear hidden_to_tag;
    size_t num_tags;
    int pad_tag_id;
    bool use_crf;
    std::unique_ptr<CRF> crf;      // null on the softmax path
    WeightedNLLLoss token_loss;

    std::vector<Matrix> tokenTargets(const Batch& batch) const;

public:
    /**
     * @brief Constructor
     * @param encoder Shared encoder, owned by the tagger
     * @param tag_vocab Tag vocabulary, must contain "<pad>"
     * @param use_crf Score with a linear-chain CRF instead of per-token softmax
     * @throws std::invalid_argument if tag_vocab has no "<pad>" tag
     */
    SlotTagger(std::unique_ptr<SequenceEncoder> encoder, const Vocabulary& tag_vocab, bool use_crf);

    void initializeWeights(double scale);

    TaggerOutput forward(const Batch& batch, bool training);

    /**
     * @brief Summed tag loss of a batch (CRF NLL or masked token NLL)
     */
    double loss(const TaggerOutput& output, const Batch& batch) const;

    /**
     * @brief Back-propagate scale · loss() through the tag scorer
     *
     * Accumulates the projection (and CRF) gradients.
     * @return Gradient w.r.t. the encoder hidden states
     */
    std::vector<Matrix> backward(const TaggerOutput& output, const Batch& batch, double scale);

    /**
     * @brief Back-propagate the combined hidden-state gradient into the encoder
     */
    void backwardEncoder(const std::vector<Matrix>& grad_hidden) { encoder->backward(grad_hidden); }

    /**
     * @brief Best tag ids of every example, truncated to its length
     *
     * CRF: Viterbi path. Softmax: per-token argmax (the result may be an
     * invalid BIO sequence).
     */
    std::vector<std::vector<int>> decode(const TaggerOutput& output, const Batch& batch) const;

    ParameterList parameters();

    SequenceEncoder& getEncoder() { return *encoder; }
    const CRF* getCRF() const { return crf.get(); }
    bool usesCRF() const { return use_crf; }
    size_t getNumTags() const { return num_tags; }
};

#endif // SLU_TAGGER_H
