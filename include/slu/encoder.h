#ifndef SLU_ENCODER_H
#define SLU_ENCODER_H

#include "batch.h"
#include "corpus.h"
#include "embedding.h"
#include "lstm.h"
#include "matrix.h"
#include "parameter.h"
#include <memory>
#include <vector>

/**
 * @brief Per-token hidden states of a batch
 *
 * When bidirectional, columns [0, hidden_size) of every timestep hold the
 * forward direction and [hidden_size, 2·hidden_size) the backward one.
 */
struct EncoderOutput {
    std::vector<Matrix> hidden;    // per timestep (batch × hiddenDim())
    std::vector<size_t> lengths;
    size_t hidden_size = 0;        // per direction
    bool bidirectional = false;

    size_t hiddenDim() const { return bidirectional ? 2 * hidden_size : hidden_size; }
    size_t batchSize() const { return lengths.size(); }
    size_t maxLength() const { return hidden.size(); }
};

/**
 * @brief Word embeddings + stacked (Bi)LSTM shared by both tasks
 *
 * Input of a token = word embedding, concatenated with the token's row of
 * the sentence feature table when one is given. Inverted dropout is applied
 * to the input of every LSTM layer and to the final output while training.
 */
class SequenceEncoder {
private:
    size_t emb_size;
    size_t hidden_size;
    size_t num_layers;
    bool bidirectional;
    double dropout;

    Embedding word_embedding;
    std::shared_ptr<const SentenceFeatures> sentence_features;

    std::vector<std::unique_ptr<LSTMLayer>> forward_layers;
    std::vector<std::unique_ptr<LSTMLayer>> backward_layers;  // empty unless bidirectional

    // Forward-pass state for backward()
    std::vector<std::vector<int>> cached_tokens;          // per timestep
    std::vector<std::vector<Matrix>> dropout_masks;       // per stage, per timestep

    std::vector<Matrix> applyDropout(const std::vector<Matrix>& sequence, bool training);

public:
    /**
     * @brief Constructor
     * @param vocab_size Word vocabulary size
     * @param emb_size Word embedding dimension
     * @param pad_id Word id kept at a zero embedding
     * @param hidden_size LSTM state size per direction
     * @param num_layers Stacked LSTM layers
     * @param bidirectional Add a right-to-left direction to every layer
     * @param dropout Drop probability in [0, 1)
     * @param sentence_features Optional frozen per-token features
     */
    SequenceEncoder(size_t vocab_size, size_t emb_size, int pad_id,
                    size_t hidden_size, size_t num_layers, bool bidirectional,
                    double dropout,
                    std::shared_ptr<const SentenceFeatures> sentence_features = nullptr);

    /**
     * @brief Uniform initialization of every parameter in [-scale, scale]
     */
    void initializeWeights(double scale);

    /**
     * @brief Encode a padded batch
     * @param training Enables dropout
     * @throws std::runtime_error if sentence features are used and an example
     *         has no sentence id or is longer than the feature table allows
     */
    EncoderOutput forward(const Batch& batch, bool training);

    /**
     * @brief Back-propagate the gradient w.r.t. EncoderOutput::hidden
     */
    void backward(const std::vector<Matrix>& grad_hidden);

    ParameterList parameters();

    size_t getHiddenSize() const { return hidden_size; }
    size_t getOutputSize() const { return bidirectional ? 2 * hidden_size : hidden_size; }
    bool isBidirectional() const { return bidirectional; }
};

#endif // SLU_ENCODER_H
