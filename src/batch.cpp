#include "slu/batch.h"
#include <algorithm>
#include <stdexcept>

size_t Batch::maxLength() const {
    size_t longest = 0;
    for (size_t length : lengths) {
        longest = std::max(longest, length);
    }
    return longest;
}

size_t Batch::totalTokens() const {
    size_t total = 0;
    for (size_t length : lengths) {
        total += length;
    }
    return total;
}

std::vector<int> Batch::tokensAt(size_t t) const {
    std::vector<int> ids(size());
    for (size_t b = 0; b < size(); ++b) {
        ids[b] = tokens[b].at(t);
    }
    return ids;
}

Batch makeBatch(const Dataset& dataset,
                const std::vector<size_t>& index,
                size_t offset,
                size_t batch_size,
                int word_pad_id,
                int tag_pad_id) {
    if (offset >= index.size()) {
        throw std::out_of_range("Batch offset past the end of the data");
    }
    if (batch_size == 0) {
        throw std::invalid_argument("Batch size must be positive");
    }

    size_t end = std::min(index.size(), offset + batch_size);

    Batch batch;
    size_t max_length = 0;
    for (size_t k = offset; k < end; ++k) {
        max_length = std::max(max_length, dataset.examples.at(index[k]).word_ids.size());
    }

    for (size_t k = offset; k < end; ++k) {
        const Example& example = dataset.examples.at(index[k]);
        size_t length = example.word_ids.size();

        std::vector<int> tokens(example.word_ids);
        std::vector<int> tags(example.tag_ids);
        std::vector<unsigned char> mask(length, 1);
        tokens.resize(max_length, word_pad_id);
        tags.resize(max_length, tag_pad_id);
        mask.resize(max_length, 0);

        batch.tokens.push_back(std::move(tokens));
        batch.tags.push_back(std::move(tags));
        batch.mask.push_back(std::move(mask));
        batch.words.push_back(example.words);
        batch.raw_tags.push_back(example.tags);
        batch.intents.push_back(example.intent_id);
        batch.intent_sets.push_back(example.intent_ids);
        batch.raw_intents.push_back(example.intents);
        batch.lengths.push_back(length);
        batch.sentence_ids.push_back(example.sentence_id);
        batch.line_numbers.push_back(example.line_number);
    }
    return batch;
}

Matrix intentTargetMatrix(const Batch& batch, size_t num_classes, bool multi_label) {
    Matrix targets(batch.size(), num_classes);
    for (size_t b = 0; b < batch.size(); ++b) {
        if (multi_label) {
            for (int id : batch.intent_sets[b]) {
                targets.set(b, static_cast<size_t>(id), 1.0);
            }
        } else {
            int id = batch.intents[b];
            if (id < 0) {
                throw std::invalid_argument("Example without an intent target");
            }
            targets.set(b, static_cast<size_t>(id), 1.0);
        }
    }
    return targets;
}
