#ifndef SLU_INTENT_CLASSIFIER_H
#define SLU_INTENT_CLASSIFIER_H

#include "encoder.h"
#include "linear.h"
#include "matrix.h"
#include "parameter.h"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief How the utterance representation is pooled from the encoder
 */
enum class IntentStrategy {
    None,              // no intent task
    TwoTails,          // "2tails"
    MaxPooling,        // "maxPooling"
    HiddenCNN,         // "hiddenCNN"
    HiddenAttention    // "hiddenAttention"
};

/**
 * @throws std::invalid_argument for an unknown name
 */
IntentStrategy parseIntentStrategy(const std::string& name);
std::string intentStrategyName(IntentStrategy strategy);

/**
 * @brief Base class for the utterance-level intent heads
 *
 * forward() pools the encoder states into one vector per example and
 * projects it to class logits; backward() returns the gradient w.r.t. every
 * encoder state so the intent loss also trains the shared encoder.
 */
class IntentClassifier {
protected:
    size_t hidden_dim;
    size_t num_classes;

public:
    IntentClassifier(size_t hidden_dim, size_t num_classes)
        : hidden_dim(hidden_dim), num_classes(num_classes) {}
    virtual ~IntentClassifier() = default;

    /**
     * @brief Class logits (batch × num_classes)
     */
    virtual Matrix forward(const EncoderOutput& encoded) = 0;

    /**
     * @brief Backward pass for the last forward(), accumulating weight gradients
     * @return Per timestep (batch × hidden_dim)
     */
    virtual std::vector<Matrix> backward(const Matrix& grad_logits) = 0;

    virtual void initializeWeights(double scale) = 0;
    virtual ParameterList parameters() = 0;
    virtual std::string getName() const = 0;

    size_t getNumClasses() const { return num_classes; }
};

/**
 * @brief Final forward state ⊕ first backward state → linear
 *
 * Without a backward direction only the final forward state is used.
 */
class TwoTailsClassifier : public IntentClassifier {
private:
    bool bidirectional;
    size_t hidden_size;
    Linear output_layer;

    std::vector<size_t> cached_lengths;
    size_t cached_steps = 0;
    Matrix cached_features;

public:
    TwoTailsClassifier(size_t hidden_size, bool bidirectional, size_t num_classes);

    Matrix forward(const EncoderOutput& encoded) override;
    std::vector<Matrix> backward(const Matrix& grad_logits) override;
    void initializeWeights(double scale) override { output_layer.initializeWeights(scale); }
    ParameterList parameters() override { return output_layer.parameters(); }
    std::string getName() const override { return "2tails"; }
};

/**
 * @brief Masked max over time → linear
 */
class MaxPoolingClassifier : public IntentClassifier {
private:
    Linear output_layer;

    std::vector<std::vector<size_t>> argmax_steps;  // [batch][feature]
    size_t cached_steps = 0;
    Matrix cached_pooled;

public:
    MaxPoolingClassifier(size_t hidden_dim, size_t num_classes);

    Matrix forward(const EncoderOutput& encoded) override;
    std::vector<Matrix> backward(const Matrix& grad_logits) override;
    void initializeWeights(double scale) override { output_layer.initializeWeights(scale); }
    ParameterList parameters() override { return output_layer.parameters(); }
    std::string getName() const override { return "maxPooling"; }
};

/**
 * @brief Width-3 convolution over time (zero padding 1) → tanh → masked max → linear
 */
class HiddenCNNClassifier : public IntentClassifier {
private:
    static constexpr size_t kWindow = 3;

    size_t channels;
    Parameter kernels[kWindow];  // (channels × hidden_dim), tap k reads h(t + k - 1)
    Parameter conv_bias;         // (channels × 1)
    Linear output_layer;

    std::vector<Matrix> cached_hidden;
    std::vector<Matrix> cached_activations;          // tanh(conv), per timestep
    std::vector<std::vector<size_t>> argmax_steps;   // [batch][channel]
    Matrix cached_pooled;

public:
    HiddenCNNClassifier(size_t hidden_dim, size_t channels, size_t num_classes);

    Matrix forward(const EncoderOutput& encoded) override;
    std::vector<Matrix> backward(const Matrix& grad_logits) override;
    void initializeWeights(double scale) override;
    ParameterList parameters() override;
    std::string getName() const override { return "hiddenCNN"; }
};

/**
 * @brief Additive attention pooling → linear
 *
 *    e(t) = vᵀ tanh(W·h(t) + b)
 *    a    = softmax over the valid positions of e
 *    c    = Σ a(t) h(t)
 */
class HiddenAttentionClassifier : public IntentClassifier {
private:
    Linear projection;   // W, b
    Parameter context;   // v, (attention_size × 1)
    Linear output_layer;

    std::vector<Matrix> cached_hidden;
    std::vector<Matrix> cached_projected;   // tanh(W·h + b), per timestep
    std::vector<size_t> cached_lengths;
    Matrix cached_weights;                  // (batch × steps) attention weights
    Matrix cached_context;

public:
    HiddenAttentionClassifier(size_t hidden_dim, size_t attention_size, size_t num_classes);

    Matrix forward(const EncoderOutput& encoded) override;
    std::vector<Matrix> backward(const Matrix& grad_logits) override;
    void initializeWeights(double scale) override;
    ParameterList parameters() override;
    std::string getName() const override { return "hiddenAttention"; }

    /**
     * @brief Attention weights of the last forward(), zero on padding
     */
    const Matrix& getAttentionWeights() const { return cached_weights; }
};

/**
 * @brief Build the head for a strategy
 * @return nullptr for IntentStrategy::None
 */
std::unique_ptr<IntentClassifier> createIntentClassifier(IntentStrategy strategy,
                                                         size_t hidden_size,
                                                         bool bidirectional,
                                                         size_t num_classes);

/**
 * @brief Predicted intent ids per example
 *
 * Single-label: the argmax. Multi-label: every class whose sigmoid
 * probability is strictly above 0.5, possibly none.
 */
std::vector<std::vector<int>> predictIntents(const Matrix& logits, bool multi_label);

#endif // SLU_INTENT_CLASSIFIER_H
