#ifndef SLU_CHUNK_EVAL_H
#define SLU_CHUNK_EVAL_H

#include <cstddef>
#include <string>
#include <vector>

/**
 * @file chunk_eval.h
 * @brief Span extraction from BIO/IOBES tags and exact-match P/R/F1
 *
 * A tag is "<Tag>-<Type>" (B-obj, I-obj, E-obj, S-obj) or an outside tag:
 * O, <pad>, <unk>, <s>, </s>, <START>, <STOP>.
 */

/**
 * @brief Labelled span, start and end are inclusive 0-based token indices
 */
struct Chunk {
    std::string label;
    size_t start;
    size_t end;

    bool operator==(const Chunk& other) const {
        return start == other.start && end == other.end && label == other.label;
    }
    bool operator!=(const Chunk& other) const { return !(*this == other); }
};

/**
 * @brief Chunks of a tag sequence framed by an implicit O on both sides
 *
 * Malformed tags still close chunks: a tag that ends a chunk without one
 * having started (e.g. "X-a" after "E-a") yields a chunk starting right
 * after the previous chunk's end.
 */
std::vector<Chunk> extractChunks(const std::vector<std::string>& tags);

/**
 * @brief Write chunks back as B-X I-X … over an O-filled sequence
 * @throws std::out_of_range if a chunk does not fit in length
 */
std::vector<std::string> reconstructTags(const std::vector<Chunk>& chunks, size_t length);

/**
 * @brief Precision / recall / F1 in percent
 */
struct Metrics {
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
};

/**
 * @brief P = TP/(TP+FP), R = TP/(TP+FN), F1 = 2TP/(2TP+FP+FN), times 100
 *
 * All three are 0 when TP is 0.
 */
Metrics computeMetrics(size_t tp, size_t fp, size_t fn);

/**
 * @brief Confusion counts of one task over one evaluation pass
 */
struct ScoreCounter {
    size_t tp = 0;
    size_t fp = 0;
    size_t fn = 0;
    size_t tn = 0;  // unused by span and set scoring

    void reset() { tp = fp = fn = tn = 0; }
    Metrics snapshot() const { return computeMetrics(tp, fp, fn); }
};

/**
 * @brief Membership scoring of predicted vs gold chunks
 *
 * Each predicted chunk found among the gold ones is a TP, otherwise an FP;
 * each gold chunk missing from the predictions is an FN. Duplicates count
 * independently.
 */
void scoreChunks(const std::vector<Chunk>& predicted,
                 const std::vector<Chunk>& gold,
                 ScoreCounter& counter);

/**
 * @brief scoreChunks() on the chunks of two tag sequences
 */
void scoreSlotTags(const std::vector<std::string>& predicted_tags,
                   const std::vector<std::string>& gold_tags,
                   ScoreCounter& counter);

/**
 * @brief Multi-label intents, same membership logic as scoreChunks()
 */
void scoreIntentSets(const std::vector<std::string>& predicted,
                     const std::vector<std::string>& gold,
                     ScoreCounter& counter);

/**
 * @brief Single-label intent against the set of acceptable gold intents
 *
 * A hit is a TP; a miss is both an FP and an FN.
 */
void scoreSingleIntent(const std::string& predicted,
                       const std::vector<std::string>& gold,
                       ScoreCounter& counter);

#endif // SLU_CHUNK_EVAL_H
