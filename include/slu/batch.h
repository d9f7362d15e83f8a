#ifndef SLU_BATCH_H
#define SLU_BATCH_H

#include "corpus.h"
#include "matrix.h"
#include <string>
#include <vector>

/**
 * @brief Padded minibatch
 *
 * Row b of every field belongs to the same example. Token and tag ids are
 * padded to maxLength() with the pad ids; raw strings stay unpadded.
 */
struct Batch {
    std::vector<std::vector<int>> tokens;
    std::vector<std::vector<int>> tags;
    std::vector<std::vector<std::string>> words;
    std::vector<std::vector<std::string>> raw_tags;
    std::vector<int> intents;                       // first gold intent
    std::vector<std::vector<int>> intent_sets;      // all gold intents
    std::vector<std::vector<std::string>> raw_intents;
    std::vector<size_t> lengths;
    std::vector<std::vector<unsigned char>> mask;   // 1 on valid positions
    std::vector<int> sentence_ids;
    std::vector<size_t> line_numbers;

    size_t size() const { return lengths.size(); }
    size_t maxLength() const;
    size_t totalTokens() const;

    /**
     * @brief Token ids of every row at timestep t
     */
    std::vector<int> tokensAt(size_t t) const;
};

/**
 * @brief Gather examples index[offset .. offset+batch_size) into a batch
 *
 * The last batch of an epoch may be smaller.
 * @throws std::out_of_range if offset is past the end of index
 */
Batch makeBatch(const Dataset& dataset,
                const std::vector<size_t>& index,
                size_t offset,
                size_t batch_size,
                int word_pad_id,
                int tag_pad_id);

/**
 * @brief Intent targets as a (batch × num_classes) matrix
 *
 * Multi-label: multi-hot over the gold set. Single-label: one-hot on the
 * first gold intent.
 */
Matrix intentTargetMatrix(const Batch& batch, size_t num_classes, bool multi_label);

#endif // SLU_BATCH_H
