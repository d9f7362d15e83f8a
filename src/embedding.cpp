#include "slu/embedding.h"
#include <stdexcept>

Embedding::Embedding(size_t vocab_size, size_t embedding_dim, int padding_idx,
                     const std::string& name)
    : vocab_size(vocab_size), embedding_dim(embedding_dim), padding_idx(padding_idx),
      table(name, vocab_size, embedding_dim) {
    if (padding_idx >= static_cast<int>(vocab_size)) {
        throw std::invalid_argument("Padding id outside the embedding table");
    }
    initializeWeights(0.1);
}

void Embedding::initializeWeights(double scale) {
    table.value.randomize(-scale, scale);
    if (padding_idx >= 0) {
        for (size_t d = 0; d < embedding_dim; ++d) {
            table.value[padding_idx][d] = 0.0;
        }
    }
}

Matrix Embedding::forward(const std::vector<int>& token_ids) const {
    Matrix output(token_ids.size(), embedding_dim);

    for (size_t b = 0; b < token_ids.size(); ++b) {
        int token_id = token_ids[b];
        if (token_id < 0 || token_id >= static_cast<int>(vocab_size)) {
            throw std::out_of_range("Token ID out of vocabulary range");
        }
        output[b] = table.value[token_id];
    }
    return output;
}

void Embedding::backward(const std::vector<int>& token_ids, const Matrix& grad_output) {
    if (grad_output.getRows() != token_ids.size() || grad_output.getCols() != embedding_dim) {
        throw std::invalid_argument("Gradient shape mismatch in Embedding::backward");
    }

    for (size_t b = 0; b < token_ids.size(); ++b) {
        int token_id = token_ids[b];
        if (token_id == padding_idx) continue;
        for (size_t d = 0; d < embedding_dim; ++d) {
            table.grad[token_id][d] += grad_output[b][d];
        }
    }
}
