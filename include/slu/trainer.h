#ifndef SLU_TRAINER_H
#define SLU_TRAINER_H

#include "batch.h"
#include "chunk_eval.h"
#include "corpus.h"
#include "intent_classifier.h"
#include "logger.h"
#include "loss.h"
#include "optimizer.h"
#include "options.h"
#include "tagger.h"
#include "vocabulary.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Losses of one batch
 *
 * Summed values as used for back-propagation; the reported per-token and
 * per-example means divide by Batch::totalTokens() and Batch::size().
 */
struct BatchLoss {
    double tag = 0.0;
    double intent = 0.0;
};

/**
 * @brief Outcome of one evaluation pass
 */
struct EvalResult {
    double tag_loss = 0.0;      // mean over batches of tag loss / tokens
    double intent_loss = 0.0;   // mean over batches of intent loss / examples
    Metrics slot;
    Metrics intent;
};

/**
 * @brief Joint slot tagging and intent detection: training loop,
 *        evaluation pass and checkpoints
 *
 * The total loss of a batch is α·L_tag + (1−α)·L_intent with α = st_weight;
 * with the intent task off it is L_tag alone.
 */
class JointTrainer {
private:
    Options options;
    Logger& logger;

    Vocabulary word_vocab;
    Vocabulary tag_vocab;
    Vocabulary intent_vocab;

    std::unique_ptr<SlotTagger> tagger;
    std::unique_ptr<IntentClassifier> classifier;  // null when the intent task is off
    std::unique_ptr<Loss> intent_loss;
    std::unique_ptr<Optimizer> optimizer;

    Dataset train_data;
    Dataset valid_data;
    Dataset test_data;
    std::vector<size_t> train_index;

    double tagWeight() const { return classifier ? options.st_weight : 1.0; }

    /**
     * @brief Forward pass and summed losses; fills the intent logits
     */
    BatchLoss forwardLosses(const Batch& batch, bool training, TaggerOutput& output,
                            Matrix& intent_logits);

    Batch batchAt(const Dataset& data, const std::vector<size_t>& index, size_t offset,
                  size_t batch_size) const;

    std::string formatLine(const Batch& batch, size_t row,
                           const std::vector<int>& predicted_tags,
                           const std::vector<int>& predicted_intents,
                           bool online) const;

public:
    /**
     * @brief Build the model for the given vocabularies
     *
     * Draws initial weights from the global generator, so seed it first.
     * @param sentence_features Frozen per-token features, or null
     */
    JointTrainer(const Options& options, Logger& logger,
                 Vocabulary words, Vocabulary tags, Vocabulary intents,
                 std::shared_ptr<const SentenceFeatures> sentence_features = nullptr);

    void setData(Dataset train, Dataset valid, Dataset test);

    /**
     * @brief Summed losses of a batch without touching any gradient
     */
    BatchLoss computeLoss(const Batch& batch);

    /**
     * @brief One optimisation step: forward, backward, clip, update
     * @return Summed losses before the update
     */
    BatchLoss trainBatch(const Batch& batch);

    /**
     * @brief Shuffle the training data and run one pass over it
     * @return Mean reported (tag, intent) losses
     */
    std::pair<double, double> trainEpoch(int epoch);

    /**
     * @brief Evaluate a split in corpus order and write one line per example
     *
     * Each line is "word:gold:pred … <=> gold intents <=> predicted intents",
     * prefixed with "<line number> : " when online.
     * @throws std::runtime_error if output_path cannot be written
     */
    EvalResult decode(const Dataset& data, const std::string& output_path, bool online);

    /**
     * @brief Train for max_epoch epochs, checkpointing on validation improvement
     * @param exp_path Directory for the per-epoch outputs and the model
     */
    void train(const std::string& exp_path);

    /**
     * @brief Decode the test split into <out_path>/test.eval with line numbers
     */
    EvalResult test(const std::string& out_path);

    /**
     * @brief Write config.json, labels.json, <prefix>.tag and <prefix>.class
     *        (the latter only with an intent head)
     * @param prefix Path of the weight files without extension
     */
    void saveModel(const std::string& prefix);

    /**
     * @brief Read the weight files written by saveModel()
     */
    void loadModel(const std::string& prefix);

    ParameterList parameters();

    const Vocabulary& getWordVocab() const { return word_vocab; }
    const Vocabulary& getTagVocab() const { return tag_vocab; }
    const Vocabulary& getIntentVocab() const { return intent_vocab; }
    SlotTagger& getTagger() { return *tagger; }
    IntentClassifier* getClassifier() { return classifier.get(); }
};

/**
 * @brief Whole run from validated options: data, model, then training or testing
 */
void runJointSLU(const Options& options);

#endif // SLU_TRAINER_H
