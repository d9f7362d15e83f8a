#include "slu/encoder.h"
#include "slu/random.h"
#include <stdexcept>
#include <string>

SequenceEncoder::SequenceEncoder(size_t vocab_size, size_t emb_size, int pad_id,
                                 size_t hidden_size, size_t num_layers, bool bidirectional,
                                 double dropout,
                                 std::shared_ptr<const SentenceFeatures> sentence_features)
    : emb_size(emb_size), hidden_size(hidden_size), num_layers(num_layers),
      bidirectional(bidirectional), dropout(dropout),
      word_embedding(vocab_size, emb_size, pad_id, "encoder.word_embedding"),
      sentence_features(std::move(sentence_features)) {
    if (num_layers == 0) {
        throw std::invalid_argument("The encoder needs at least one LSTM layer");
    }
    if (dropout < 0.0 || dropout >= 1.0) {
        throw std::invalid_argument("Dropout must be in [0, 1)");
    }

    size_t input_size = emb_size;
    if (this->sentence_features) {
        input_size += this->sentence_features->getFeatureSize();
    }

    for (size_t l = 0; l < num_layers; ++l) {
        std::string prefix = "encoder.lstm" + std::to_string(l);
        forward_layers.push_back(
            std::make_unique<LSTMLayer>(input_size, hidden_size, false, prefix + ".forward"));
        if (bidirectional) {
            backward_layers.push_back(
                std::make_unique<LSTMLayer>(input_size, hidden_size, true, prefix + ".backward"));
        }
        input_size = getOutputSize();
    }
}

void SequenceEncoder::initializeWeights(double scale) {
    word_embedding.initializeWeights(scale);
    for (auto& layer : forward_layers) layer->initializeWeights(scale);
    for (auto& layer : backward_layers) layer->initializeWeights(scale);
}

ParameterList SequenceEncoder::parameters() {
    ParameterList params = word_embedding.parameters();
    for (size_t l = 0; l < num_layers; ++l) {
        for (Parameter* p : forward_layers[l]->parameters()) params.push_back(p);
        if (bidirectional) {
            for (Parameter* p : backward_layers[l]->parameters()) params.push_back(p);
        }
    }
    return params;
}

// ==================== Dropout ====================

std::vector<Matrix> SequenceEncoder::applyDropout(const std::vector<Matrix>& sequence,
                                                  bool training) {
    std::vector<Matrix> masks;
    if (!training || dropout <= 0.0) {
        dropout_masks.push_back(masks);
        return sequence;
    }

    double scale = 1.0 / (1.0 - dropout);
    std::vector<Matrix> dropped;
    dropped.reserve(sequence.size());
    for (const Matrix& step : sequence) {
        Matrix mask(step.getRows(), step.getCols());
        for (size_t i = 0; i < step.getRows(); ++i) {
            for (size_t j = 0; j < step.getCols(); ++j) {
                mask[i][j] = Random::uniform(0.0, 1.0) < dropout ? 0.0 : scale;
            }
        }
        dropped.push_back(step.hadamard(mask));
        masks.push_back(mask);
    }
    dropout_masks.push_back(masks);
    return dropped;
}

// ==================== Forward ====================

EncoderOutput SequenceEncoder::forward(const Batch& batch, bool training) {
    size_t batch_size = batch.size();
    size_t seq_length = batch.maxLength();

    if (sentence_features) {
        for (size_t b = 0; b < batch_size; ++b) {
            if (batch.sentence_ids[b] < 0) {
                throw std::runtime_error("Line " + std::to_string(batch.line_numbers[b]) +
                                         " has no sentence id for the sentence features");
            }
            if (batch.lengths[b] > sentence_features->getMaxLength()) {
                throw std::runtime_error("Line " + std::to_string(batch.line_numbers[b]) +
                                         " is longer than the sentence feature length " +
                                         std::to_string(sentence_features->getMaxLength()));
            }
        }
    }

    cached_tokens.assign(seq_length, std::vector<int>());
    dropout_masks.clear();

    // Token inputs
    std::vector<Matrix> inputs(seq_length);
    for (size_t t = 0; t < seq_length; ++t) {
        cached_tokens[t] = batch.tokensAt(t);
        Matrix embedded = word_embedding.forward(cached_tokens[t]);

        if (sentence_features) {
            size_t feature_size = sentence_features->getFeatureSize();
            Matrix features(batch_size, feature_size);
            for (size_t b = 0; b < batch_size; ++b) {
                if (t >= batch.lengths[b]) continue;
                features[b] = sentence_features->tokenFeature(batch.sentence_ids[b], t);
            }
            embedded = Matrix::concatCols(embedded, features);
        }
        inputs[t] = embedded;
    }

    // Stacked LSTM layers
    std::vector<Matrix> sequence = inputs;
    for (size_t l = 0; l < num_layers; ++l) {
        sequence = applyDropout(sequence, training);

        std::vector<Matrix> outputs = forward_layers[l]->forward(sequence, batch.lengths);
        if (bidirectional) {
            std::vector<Matrix> reversed = backward_layers[l]->forward(sequence, batch.lengths);
            for (size_t t = 0; t < seq_length; ++t) {
                outputs[t] = Matrix::concatCols(outputs[t], reversed[t]);
            }
        }
        sequence = outputs;
    }

    EncoderOutput output;
    output.hidden = applyDropout(sequence, training);
    output.lengths = batch.lengths;
    output.hidden_size = hidden_size;
    output.bidirectional = bidirectional;
    return output;
}

// ==================== Backward ====================

void SequenceEncoder::backward(const std::vector<Matrix>& grad_hidden) {
    size_t seq_length = cached_tokens.size();
    if (grad_hidden.size() != seq_length || dropout_masks.size() != num_layers + 1) {
        throw std::invalid_argument("SequenceEncoder::backward does not match the last forward()");
    }

    auto undoDropout = [&](std::vector<Matrix>& grads, size_t stage) {
        const std::vector<Matrix>& masks = dropout_masks[stage];
        if (masks.empty()) return;
        for (size_t t = 0; t < seq_length; ++t) {
            grads[t] = grads[t].hadamard(masks[t]);
        }
    };

    std::vector<Matrix> grad = grad_hidden;
    undoDropout(grad, num_layers);

    for (size_t step = 0; step < num_layers; ++step) {
        size_t l = num_layers - 1 - step;

        std::vector<Matrix> grad_input;
        if (bidirectional) {
            std::vector<Matrix> grad_forward(seq_length);
            std::vector<Matrix> grad_backward(seq_length);
            for (size_t t = 0; t < seq_length; ++t) {
                grad_forward[t] = grad[t].sliceCols(0, hidden_size);
                grad_backward[t] = grad[t].sliceCols(hidden_size, 2 * hidden_size);
            }
            grad_input = forward_layers[l]->backward(grad_forward);
            std::vector<Matrix> grad_reversed = backward_layers[l]->backward(grad_backward);
            for (size_t t = 0; t < seq_length; ++t) {
                grad_input[t] += grad_reversed[t];
            }
        } else {
            grad_input = forward_layers[l]->backward(grad);
        }

        undoDropout(grad_input, l);
        grad = grad_input;
    }

    // Sentence features are frozen: only the embedding columns flow back
    for (size_t t = 0; t < seq_length; ++t) {
        word_embedding.backward(cached_tokens[t], grad[t].sliceCols(0, emb_size));
    }
}
