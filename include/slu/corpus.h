#ifndef SLU_CORPUS_H
#define SLU_CORPUS_H

#include "matrix.h"
#include "vocabulary.h"
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Corpus format
 *
 * One utterance per line, word:tag items followed by the intents:
 *
 *     book:O a:O flight:B-obj <=> book_flight;atis_airfare
 *
 * The word/tag separator is the last ':' of an item so words may contain
 * colons. The intent field may be empty.
 */

struct CorpusLine {
    std::vector<std::string> words;
    std::vector<std::string> tags;
    std::vector<std::string> intents;
};

/**
 * @brief Labelled utterance, immutable after reading
 */
struct Example {
    std::vector<std::string> words;
    std::vector<int> word_ids;
    std::vector<std::string> tags;       // raw gold tags
    std::vector<int> tag_ids;
    std::vector<std::string> intents;    // raw gold intents
    std::vector<int> intent_ids;
    int intent_id = -1;                  // first gold intent, for single-label training
    int sentence_id = -1;                // row of the sentence feature table
    size_t line_number = 0;              // 1-based line in the corpus file
};

struct Dataset {
    std::string path;
    std::vector<Example> examples;

    size_t size() const { return examples.size(); }
};

/**
 * @brief Split one corpus line
 * @throws std::runtime_error on a malformed line
 */
CorpusLine parseCorpusLine(const std::string& line, size_t line_number);

/**
 * @brief Read a labelled split into ids
 *
 * Unknown words, tags and intents map to "<unk>"; the raw strings are kept
 * for scoring.
 * @throws std::runtime_error on unreadable files or malformed lines
 */
Dataset readCorpus(const std::string& path,
                   const Vocabulary& word_vocab,
                   const Vocabulary& tag_vocab,
                   const Vocabulary& intent_vocab,
                   bool lowercase);

/**
 * @brief Word vocabulary from the words of a training split
 * @param min_freq Keep words seen at least this often
 */
Vocabulary buildWordVocabulary(const std::string& path, size_t min_freq, bool lowercase);

/**
 * @brief Sentence text → sentence id, one sentence per line
 */
class SentenceBank {
private:
    std::unordered_map<std::string, int> sentence_to_id;

public:
    static SentenceBank read(const std::string& path);

    /**
     * @brief Id of a whitespace-joined sentence
     * @throws std::runtime_error for an unknown sentence
     */
    int lookup(const std::string& sentence) const;

    size_t size() const { return sentence_to_id.size(); }
};

/**
 * @brief Set sentence_id of every example from the bank
 */
void attachSentenceIds(Dataset& dataset, const SentenceBank& bank);

/**
 * @brief Precomputed per-token sentence features
 *
 * Row r holds max_length consecutive vectors of feature_size values: the
 * features of tokens 0..max_length-1 of sentence r.
 */
class SentenceFeatures {
private:
    Matrix table;
    size_t max_length;
    size_t feature_size;

public:
    SentenceFeatures(Matrix table, size_t max_length, size_t feature_size);

    /**
     * @brief Read one whitespace-separated row per line
     * @throws std::runtime_error on unreadable files or a row of the wrong width
     */
    static SentenceFeatures read(const std::string& path, size_t max_length,
                                 size_t feature_size);

    /**
     * @brief Feature vector of one token
     * @throws std::out_of_range for an unknown sentence or a token past max_length
     */
    std::vector<double> tokenFeature(int sentence_id, size_t position) const;

    size_t getFeatureSize() const { return feature_size; }
    size_t getMaxLength() const { return max_length; }
    size_t numSentences() const { return table.getRows(); }
};

#endif // SLU_CORPUS_H
