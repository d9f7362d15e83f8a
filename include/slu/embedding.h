#ifndef SLU_EMBEDDING_H
#define SLU_EMBEDDING_H

#include "matrix.h"
#include "parameter.h"
#include <string>
#include <vector>

/**
 * @brief Token Embedding Layer
 *
 * Embedding(token_id) = lookup_table[token_id]
 * The padding id, when given, always maps to a zero vector and never
 * receives gradient.
 */
class Embedding {
private:
    size_t vocab_size;
    size_t embedding_dim;
    int padding_idx;
    Parameter table;  // (vocab_size × embedding_dim)

public:
    /**
     * @brief Constructor
     * @param vocab_size Size of vocabulary
     * @param embedding_dim Dimension of embedding vectors
     * @param padding_idx Id kept at zero, or -1 for none
     * @param name Parameter name
     */
    Embedding(size_t vocab_size, size_t embedding_dim, int padding_idx,
              const std::string& name);

    /**
     * @brief Uniform initialization in [-scale, scale]
     */
    void initializeWeights(double scale);

    /**
     * @brief Look up one id per row
     * @param token_ids Ids for one timestep of a batch
     * @return (token_ids.size() × embedding_dim)
     */
    Matrix forward(const std::vector<int>& token_ids) const;

    /**
     * @brief Accumulate row gradients for the ids used in forward()
     */
    void backward(const std::vector<int>& token_ids, const Matrix& grad_output);

    ParameterList parameters() { return {&table}; }

    size_t getVocabSize() const { return vocab_size; }
    size_t getEmbeddingDim() const { return embedding_dim; }
};

#endif // SLU_EMBEDDING_H
