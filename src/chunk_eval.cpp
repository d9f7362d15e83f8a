#include "slu/chunk_eval.h"
#include <algorithm>
#include <stdexcept>

namespace {

struct TagParts {
    char tag;
    std::string type;
};

bool isOutside(const std::string& tag) {
    return tag == "O" || tag == "<pad>" || tag == "<unk>" || tag == "<s>" ||
           tag == "</s>" || tag == "<START>" || tag == "<STOP>";
}

// Outside tags carry the type "O", so a typed tag next to them always differs in type
TagParts splitTag(const std::string& tag) {
    if (tag.empty() || isOutside(tag)) {
        return {'O', "O"};
    }
    return {tag[0], tag.size() > 2 ? tag.substr(2) : ""};
}

bool startOfChunk(const TagParts& previous, const TagParts& current) {
    char prev = previous.tag;
    char tag = current.tag;
    if (tag == 'B' || tag == 'S') return true;
    if (prev == 'O' && (tag == 'I' || tag == 'E')) return true;
    if (prev == 'E' && (tag == 'I' || tag == 'E')) return true;
    if (prev == 'S' && (tag == 'I' || tag == 'E')) return true;
    return tag != 'O' && current.type != previous.type;
}

bool endOfChunk(const TagParts& current, const TagParts& next) {
    char tag = current.tag;
    char following = next.tag;
    if (tag == 'E' || tag == 'S') return true;
    if ((tag == 'B' || tag == 'I') &&
        (following == 'B' || following == 'O' || following == 'S')) {
        return true;
    }
    return tag != 'O' && current.type != next.type;
}

template <typename T>
bool contains(const std::vector<T>& items, const T& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

template <typename T>
void scoreMembership(const std::vector<T>& predicted, const std::vector<T>& gold,
                     ScoreCounter& counter) {
    for (const T& item : predicted) {
        if (contains(gold, item)) {
            ++counter.tp;
        } else {
            ++counter.fp;
        }
    }
    for (const T& item : gold) {
        if (!contains(predicted, item)) {
            ++counter.fn;
        }
    }
}

}  // namespace

// ==================== Chunks ====================

std::vector<Chunk> extractChunks(const std::vector<std::string>& tags) {
    std::vector<Chunk> chunks;
    const TagParts outside{'O', "O"};

    TagParts previous = outside;
    size_t chunk_start = 0;
    for (size_t i = 0; i < tags.size(); ++i) {
        TagParts current = splitTag(tags[i]);
        TagParts next = i + 1 < tags.size() ? splitTag(tags[i + 1]) : outside;

        if (startOfChunk(previous, current)) {
            chunk_start = i;
        }
        if (endOfChunk(current, next)) {
            chunks.push_back({current.type, chunk_start, i});
            // A chunk that ends without a start of its own begins after this one
            chunk_start = i + 1;
        }
        previous = current;
    }
    return chunks;
}

std::vector<std::string> reconstructTags(const std::vector<Chunk>& chunks, size_t length) {
    std::vector<std::string> tags(length, "O");
    for (const Chunk& chunk : chunks) {
        if (chunk.start > chunk.end || chunk.end >= length) {
            throw std::out_of_range("Chunk [" + std::to_string(chunk.start) + ", " +
                                    std::to_string(chunk.end) + "] does not fit " +
                                    std::to_string(length) + " tokens");
        }
        tags[chunk.start] = "B-" + chunk.label;
        for (size_t i = chunk.start + 1; i <= chunk.end; ++i) {
            tags[i] = "I-" + chunk.label;
        }
    }
    return tags;
}

// ==================== Metrics ====================

Metrics computeMetrics(size_t tp, size_t fp, size_t fn) {
    Metrics metrics;
    if (tp == 0) {
        return metrics;
    }
    double true_positives = static_cast<double>(tp);
    metrics.precision = 100.0 * true_positives / static_cast<double>(tp + fp);
    metrics.recall = 100.0 * true_positives / static_cast<double>(tp + fn);
    metrics.f1 = 100.0 * 2.0 * true_positives / static_cast<double>(2 * tp + fp + fn);
    return metrics;
}

void scoreChunks(const std::vector<Chunk>& predicted,
                 const std::vector<Chunk>& gold,
                 ScoreCounter& counter) {
    scoreMembership(predicted, gold, counter);
}

void scoreSlotTags(const std::vector<std::string>& predicted_tags,
                   const std::vector<std::string>& gold_tags,
                   ScoreCounter& counter) {
    scoreChunks(extractChunks(predicted_tags), extractChunks(gold_tags), counter);
}

void scoreIntentSets(const std::vector<std::string>& predicted,
                     const std::vector<std::string>& gold,
                     ScoreCounter& counter) {
    scoreMembership(predicted, gold, counter);
}

void scoreSingleIntent(const std::string& predicted,
                       const std::vector<std::string>& gold,
                       ScoreCounter& counter) {
    if (contains(gold, predicted)) {
        ++counter.tp;
    } else {
        ++counter.fp;
        ++counter.fn;
    }
}
