#include "slu/intent_classifier.h"
#include "slu/activation.h"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

void checkEncoded(const EncoderOutput& encoded, size_t hidden_dim) {
    if (encoded.hidden.empty()) {
        throw std::invalid_argument("Intent classifier needs at least one timestep");
    }
    for (const Matrix& step : encoded.hidden) {
        if (step.getCols() != hidden_dim || step.getRows() != encoded.batchSize()) {
            throw std::invalid_argument("Encoder output shape mismatch in intent classifier");
        }
    }
    for (size_t length : encoded.lengths) {
        if (length == 0 || length > encoded.hidden.size()) {
            throw std::invalid_argument("Invalid sequence length in intent classifier");
        }
    }
}

std::vector<Matrix> zeroSequence(size_t steps, size_t rows, size_t cols) {
    return std::vector<Matrix>(steps, Matrix(rows, cols));
}

}  // namespace

IntentStrategy parseIntentStrategy(const std::string& name) {
    if (name == "none") return IntentStrategy::None;
    if (name == "2tails") return IntentStrategy::TwoTails;
    if (name == "maxPooling") return IntentStrategy::MaxPooling;
    if (name == "hiddenCNN") return IntentStrategy::HiddenCNN;
    if (name == "hiddenAttention") return IntentStrategy::HiddenAttention;
    throw std::invalid_argument("Unknown intent strategy: " + name);
}

std::string intentStrategyName(IntentStrategy strategy) {
    switch (strategy) {
        case IntentStrategy::None: return "none";
        case IntentStrategy::TwoTails: return "2tails";
        case IntentStrategy::MaxPooling: return "maxPooling";
        case IntentStrategy::HiddenCNN: return "hiddenCNN";
        case IntentStrategy::HiddenAttention: return "hiddenAttention";
    }
    return "none";
}

// ═══════════════════════════════════════════════════════════════════════════
// TwoTailsClassifier
// ═══════════════════════════════════════════════════════════════════════════

TwoTailsClassifier::TwoTailsClassifier(size_t hidden_size, bool bidirectional, size_t num_classes)
    : IntentClassifier(bidirectional ? 2 * hidden_size : hidden_size, num_classes),
      bidirectional(bidirectional), hidden_size(hidden_size),
      output_layer(hidden_dim, num_classes, "intent.hidden2class") {}

Matrix TwoTailsClassifier::forward(const EncoderOutput& encoded) {
    checkEncoded(encoded, hidden_dim);

    size_t batch_size = encoded.batchSize();
    cached_lengths = encoded.lengths;
    cached_steps = encoded.maxLength();
    cached_features = Matrix(batch_size, hidden_dim);

    for (size_t b = 0; b < batch_size; ++b) {
        const std::vector<double>& last = encoded.hidden[cached_lengths[b] - 1][b];
        for (size_t j = 0; j < hidden_size; ++j) {
            cached_features[b][j] = last[j];
        }
        if (bidirectional) {
            // The backward direction has read the whole utterance at position 0
            const std::vector<double>& first = encoded.hidden[0][b];
            for (size_t j = 0; j < hidden_size; ++j) {
                cached_features[b][hidden_size + j] = first[hidden_size + j];
            }
        }
    }
    return output_layer.forward(cached_features);
}

std::vector<Matrix> TwoTailsClassifier::backward(const Matrix& grad_logits) {
    Matrix grad_features = output_layer.backward(cached_features, grad_logits);

    size_t batch_size = cached_lengths.size();
    std::vector<Matrix> grad_hidden = zeroSequence(cached_steps, batch_size, hidden_dim);
    for (size_t b = 0; b < batch_size; ++b) {
        for (size_t j = 0; j < hidden_size; ++j) {
            grad_hidden[cached_lengths[b] - 1][b][j] += grad_features[b][j];
        }
        if (bidirectional) {
            for (size_t j = 0; j < hidden_size; ++j) {
                grad_hidden[0][b][hidden_size + j] += grad_features[b][hidden_size + j];
            }
        }
    }
    return grad_hidden;
}

// ═══════════════════════════════════════════════════════════════════════════
// MaxPoolingClassifier
// ═══════════════════════════════════════════════════════════════════════════

MaxPoolingClassifier::MaxPoolingClassifier(size_t hidden_dim, size_t num_classes)
    : IntentClassifier(hidden_dim, num_classes),
      output_layer(hidden_dim, num_classes, "intent.hidden2class") {}

Matrix MaxPoolingClassifier::forward(const EncoderOutput& encoded) {
    checkEncoded(encoded, hidden_dim);

    size_t batch_size = encoded.batchSize();
    cached_steps = encoded.maxLength();
    cached_pooled = Matrix(batch_size, hidden_dim);
    argmax_steps.assign(batch_size, std::vector<size_t>(hidden_dim, 0));

    for (size_t b = 0; b < batch_size; ++b) {
        for (size_t j = 0; j < hidden_dim; ++j) {
            double best = -std::numeric_limits<double>::infinity();
            for (size_t t = 0; t < encoded.lengths[b]; ++t) {
                if (encoded.hidden[t][b][j] > best) {
                    best = encoded.hidden[t][b][j];
                    argmax_steps[b][j] = t;
                }
            }
            cached_pooled[b][j] = best;
        }
    }
    return output_layer.forward(cached_pooled);
}

std::vector<Matrix> MaxPoolingClassifier::backward(const Matrix& grad_logits) {
    Matrix grad_pooled = output_layer.backward(cached_pooled, grad_logits);

    size_t batch_size = argmax_steps.size();
    std::vector<Matrix> grad_hidden = zeroSequence(cached_steps, batch_size, hidden_dim);
    for (size_t b = 0; b < batch_size; ++b) {
        for (size_t j = 0; j < hidden_dim; ++j) {
            grad_hidden[argmax_steps[b][j]][b][j] += grad_pooled[b][j];
        }
    }
    return grad_hidden;
}

// ═══════════════════════════════════════════════════════════════════════════
// HiddenCNNClassifier
// ═══════════════════════════════════════════════════════════════════════════

HiddenCNNClassifier::HiddenCNNClassifier(size_t hidden_dim, size_t channels, size_t num_classes)
    : IntentClassifier(hidden_dim, num_classes), channels(channels),
      conv_bias("intent.conv.bias", channels, 1),
      output_layer(channels, num_classes, "intent.hidden2class") {
    for (size_t k = 0; k < kWindow; ++k) {
        kernels[k] = Parameter("intent.conv.tap" + std::to_string(k), channels, hidden_dim);
        kernels[k].value.xavierInit(kWindow * hidden_dim, channels);
    }
}

void HiddenCNNClassifier::initializeWeights(double scale) {
    for (Parameter* p : parameters()) {
        p->value.randomize(-scale, scale);
    }
}

ParameterList HiddenCNNClassifier::parameters() {
    ParameterList params;
    for (size_t k = 0; k < kWindow; ++k) params.push_back(&kernels[k]);
    params.push_back(&conv_bias);
    for (Parameter* p : output_layer.parameters()) params.push_back(p);
    return params;
}

Matrix HiddenCNNClassifier::forward(const EncoderOutput& encoded) {
    checkEncoded(encoded, hidden_dim);

    size_t batch_size = encoded.batchSize();
    size_t steps = encoded.maxLength();
    cached_hidden = encoded.hidden;
    cached_activations.assign(steps, Matrix());

    // Padded positions of the encoder output are zero, so the window of a
    // row's last token sees the same zero padding as past the batch end
    for (size_t t = 0; t < steps; ++t) {
        Matrix pre(batch_size, channels);
        for (size_t k = 0; k < kWindow; ++k) {
            long source = static_cast<long>(t) + static_cast<long>(k) - 1;
            if (source < 0 || source >= static_cast<long>(steps)) continue;
            pre += cached_hidden[source] * kernels[k].value.transpose();
        }
        for (size_t b = 0; b < batch_size; ++b) {
            for (size_t c = 0; c < channels; ++c) {
                pre[b][c] += conv_bias.value[c][0];
            }
        }
        cached_activations[t] = pre.apply([](double x) { return std::tanh(x); });
    }

    cached_pooled = Matrix(batch_size, channels);
    argmax_steps.assign(batch_size, std::vector<size_t>(channels, 0));
    for (size_t b = 0; b < batch_size; ++b) {
        for (size_t c = 0; c < channels; ++c) {
            double best = -std::numeric_limits<double>::infinity();
            for (size_t t = 0; t < encoded.lengths[b]; ++t) {
                if (cached_activations[t][b][c] > best) {
                    best = cached_activations[t][b][c];
                    argmax_steps[b][c] = t;
                }
            }
            cached_pooled[b][c] = best;
        }
    }
    return output_layer.forward(cached_pooled);
}

std::vector<Matrix> HiddenCNNClassifier::backward(const Matrix& grad_logits) {
    Matrix grad_pooled = output_layer.backward(cached_pooled, grad_logits);

    size_t steps = cached_hidden.size();
    size_t batch_size = argmax_steps.size();

    // Max pooling routes each channel gradient to one timestep
    std::vector<Matrix> grad_activation = zeroSequence(steps, batch_size, channels);
    for (size_t b = 0; b < batch_size; ++b) {
        for (size_t c = 0; c < channels; ++c) {
            grad_activation[argmax_steps[b][c]][b][c] += grad_pooled[b][c];
        }
    }

    Tanh tanh_activation;
    std::vector<Matrix> grad_hidden = zeroSequence(steps, batch_size, hidden_dim);
    for (size_t t = 0; t < steps; ++t) {
        Matrix grad_pre = tanh_activation.backward(cached_activations[t], grad_activation[t]);

        Matrix bias_grad = grad_pre.sumCols();
        for (size_t c = 0; c < channels; ++c) {
            conv_bias.grad[c][0] += bias_grad[0][c];
        }

        for (size_t k = 0; k < kWindow; ++k) {
            long source = static_cast<long>(t) + static_cast<long>(k) - 1;
            if (source < 0 || source >= static_cast<long>(steps)) continue;
            kernels[k].grad += grad_pre.transpose() * cached_hidden[source];
            grad_hidden[source] += grad_pre * kernels[k].value;
        }
    }
    return grad_hidden;
}

// ═══════════════════════════════════════════════════════════════════════════
// HiddenAttentionClassifier
// ═══════════════════════════════════════════════════════════════════════════

HiddenAttentionClassifier::HiddenAttentionClassifier(size_t hidden_dim, size_t attention_size,
                                                     size_t num_classes)
    : IntentClassifier(hidden_dim, num_classes),
      projection(hidden_dim, attention_size, "intent.attention.proj"),
      context("intent.attention.context", attention_size, 1),
      output_layer(hidden_dim, num_classes, "intent.hidden2class") {
    context.value.xavierInit(attention_size, 1);
}

void HiddenAttentionClassifier::initializeWeights(double scale) {
    projection.initializeWeights(scale);
    context.value.randomize(-scale, scale);
    output_layer.initializeWeights(scale);
}

ParameterList HiddenAttentionClassifier::parameters() {
    ParameterList params = projection.parameters();
    params.push_back(&context);
    for (Parameter* p : output_layer.parameters()) params.push_back(p);
    return params;
}

Matrix HiddenAttentionClassifier::forward(const EncoderOutput& encoded) {
    checkEncoded(encoded, hidden_dim);

    size_t batch_size = encoded.batchSize();
    size_t steps = encoded.maxLength();
    cached_hidden = encoded.hidden;
    cached_lengths = encoded.lengths;
    cached_projected.assign(steps, Matrix());

    // Energies e(t) = vᵀ tanh(W·h(t) + b), one column per timestep
    Matrix energies(batch_size, steps);
    for (size_t t = 0; t < steps; ++t) {
        cached_projected[t] = projection.forward(cached_hidden[t]).apply(
            [](double x) { return std::tanh(x); });
        Matrix scores = cached_projected[t] * context.value;
        for (size_t b = 0; b < batch_size; ++b) {
            energies[b][t] = scores[b][0];
        }
    }

    // Softmax over the valid prefix of every row
    cached_weights = Matrix(batch_size, steps);
    for (size_t b = 0; b < batch_size; ++b) {
        std::vector<double> valid(energies[b].begin(),
                                  energies[b].begin() + static_cast<std::ptrdiff_t>(cached_lengths[b]));
        double log_norm = logSumExp(valid);
        for (size_t t = 0; t < cached_lengths[b]; ++t) {
            cached_weights[b][t] = std::exp(valid[t] - log_norm);
        }
    }

    cached_context = Matrix(batch_size, hidden_dim);
    for (size_t t = 0; t < steps; ++t) {
        for (size_t b = 0; b < batch_size; ++b) {
            double weight = cached_weights[b][t];
            if (weight == 0.0) continue;
            for (size_t j = 0; j < hidden_dim; ++j) {
                cached_context[b][j] += weight * cached_hidden[t][b][j];
            }
        }
    }
    return output_layer.forward(cached_context);
}

std::vector<Matrix> HiddenAttentionClassifier::backward(const Matrix& grad_logits) {
    Matrix grad_context = output_layer.backward(cached_context, grad_logits);

    size_t steps = cached_hidden.size();
    size_t batch_size = cached_lengths.size();
    std::vector<Matrix> grad_hidden = zeroSequence(steps, batch_size, hidden_dim);

    // c = Σ a(t) h(t): direct path into h and gradient of the weights
    Matrix grad_weights(batch_size, steps);
    for (size_t t = 0; t < steps; ++t) {
        for (size_t b = 0; b < batch_size; ++b) {
            if (t >= cached_lengths[b]) continue;
            double weight = cached_weights[b][t];
            double dot = 0.0;
            for (size_t j = 0; j < hidden_dim; ++j) {
                grad_hidden[t][b][j] += weight * grad_context[b][j];
                dot += grad_context[b][j] * cached_hidden[t][b][j];
            }
            grad_weights[b][t] = dot;
        }
    }

    // Softmax backward: de(t) = a(t) · (da(t) - Σ_s a(s) da(s))
    Matrix grad_energies(batch_size, steps);
    for (size_t b = 0; b < batch_size; ++b) {
        double expected = 0.0;
        for (size_t t = 0; t < cached_lengths[b]; ++t) {
            expected += cached_weights[b][t] * grad_weights[b][t];
        }
        for (size_t t = 0; t < cached_lengths[b]; ++t) {
            grad_energies[b][t] = cached_weights[b][t] * (grad_weights[b][t] - expected);
        }
    }

    Tanh tanh_activation;
    for (size_t t = 0; t < steps; ++t) {
        Matrix grad_scores(batch_size, 1);
        for (size_t b = 0; b < batch_size; ++b) {
            grad_scores[b][0] = grad_energies[b][t];
        }

        context.grad += cached_projected[t].transpose() * grad_scores;
        Matrix grad_projected = grad_scores * context.value.transpose();
        Matrix grad_pre = tanh_activation.backward(cached_projected[t], grad_projected);
        grad_hidden[t] += projection.backward(cached_hidden[t], grad_pre);
    }
    return grad_hidden;
}

// ═══════════════════════════════════════════════════════════════════════════
// Factory and decoding
// ═══════════════════════════════════════════════════════════════════════════

std::unique_ptr<IntentClassifier> createIntentClassifier(IntentStrategy strategy,
                                                         size_t hidden_size,
                                                         bool bidirectional,
                                                         size_t num_classes) {
    size_t hidden_dim = bidirectional ? 2 * hidden_size : hidden_size;
    switch (strategy) {
        case IntentStrategy::None:
            return nullptr;
        case IntentStrategy::TwoTails:
            return std::make_unique<TwoTailsClassifier>(hidden_size, bidirectional, num_classes);
        case IntentStrategy::MaxPooling:
            return std::make_unique<MaxPoolingClassifier>(hidden_dim, num_classes);
        case IntentStrategy::HiddenCNN:
            return std::make_unique<HiddenCNNClassifier>(hidden_dim, hidden_dim, num_classes);
        case IntentStrategy::HiddenAttention:
            return std::make_unique<HiddenAttentionClassifier>(hidden_dim, hidden_dim, num_classes);
    }
    throw std::invalid_argument("Unknown intent strategy");
}

std::vector<std::vector<int>> predictIntents(const Matrix& logits, bool multi_label) {
    std::vector<std::vector<int>> predictions(logits.getRows());
    for (size_t b = 0; b < logits.getRows(); ++b) {
        if (!multi_label) {
            predictions[b].push_back(static_cast<int>(logits.argmaxRow(b)));
            continue;
        }
        for (size_t j = 0; j < logits.getCols(); ++j) {
            if (Sigmoid::value(logits[b][j]) > 0.5) {
                predictions[b].push_back(static_cast<int>(j));
            }
        }
    }
    return predictions;
}
