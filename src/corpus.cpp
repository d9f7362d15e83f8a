#include "slu/corpus.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

const char* const kIntentSeparator = "<=>";

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> items;
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string joinWords(const std::vector<std::string>& words) {
    std::string sentence;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) sentence += ' ';
        sentence += words[i];
    }
    return sentence;
}

std::runtime_error corpusError(const std::string& path, size_t line_number,
                               const std::string& message) {
    return std::runtime_error(path + ":" + std::to_string(line_number) + ": " + message);
}

}  // namespace

// ==================== Corpus lines ====================

CorpusLine parseCorpusLine(const std::string& line, size_t line_number) {
    size_t separator = line.find(kIntentSeparator);
    if (separator == std::string::npos) {
        throw std::runtime_error("line " + std::to_string(line_number) +
                                 ": missing '<=>' before the intents");
    }

    CorpusLine parsed;
    for (const std::string& item : splitWhitespace(line.substr(0, separator))) {
        size_t colon = item.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == item.size()) {
            throw std::runtime_error("line " + std::to_string(line_number) +
                                     ": expected word:tag, got '" + item + "'");
        }
        parsed.words.push_back(item.substr(0, colon));
        parsed.tags.push_back(item.substr(colon + 1));
    }
    if (parsed.words.empty()) {
        throw std::runtime_error("line " + std::to_string(line_number) + ": no tokens");
    }

    std::string intent_field = line.substr(separator + std::string(kIntentSeparator).size());
    for (const std::string& chunk : splitWhitespace(intent_field)) {
        std::istringstream stream(chunk);
        std::string intent;
        while (std::getline(stream, intent, ';')) {
            if (!intent.empty()) parsed.intents.push_back(intent);
        }
    }
    return parsed;
}

Dataset readCorpus(const std::string& path,
                   const Vocabulary& word_vocab,
                   const Vocabulary& tag_vocab,
                   const Vocabulary& intent_vocab,
                   bool lowercase) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open corpus file: " + path);
    }

    Dataset dataset;
    dataset.path = path;

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        CorpusLine parsed;
        try {
            parsed = parseCorpusLine(line, line_number);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(path + ": " + e.what());
        }

        Example example;
        example.line_number = line_number;
        example.words = parsed.words;
        example.tags = parsed.tags;
        example.intents = parsed.intents;

        for (const std::string& word : parsed.words) {
            example.word_ids.push_back(word_vocab.lookup(lowercase ? toLower(word) : word));
        }
        for (const std::string& tag : parsed.tags) {
            example.tag_ids.push_back(tag_vocab.lookup(tag));
        }
        for (const std::string& intent : parsed.intents) {
            example.intent_ids.push_back(intent_vocab.lookup(intent));
        }

        // An utterance without intent trains towards <unk>
        if (!example.intent_ids.empty()) {
            example.intent_id = example.intent_ids.front();
        } else if (intent_vocab.getUnkId() >= 0) {
            example.intent_id = intent_vocab.getUnkId();
        } else {
            throw corpusError(path, line_number, "no intent and no <unk> intent to fall back on");
        }

        dataset.examples.push_back(std::move(example));
    }
    return dataset;
}

Vocabulary buildWordVocabulary(const std::string& path, size_t min_freq, bool lowercase) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open corpus file: " + path);
    }

    // First-seen order keeps ids stable across runs
    std::vector<std::string> order;
    std::unordered_map<std::string, size_t> counts;

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        CorpusLine parsed;
        try {
            parsed = parseCorpusLine(line, line_number);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(path + ": " + e.what());
        }

        for (const std::string& raw : parsed.words) {
            std::string word = lowercase ? toLower(raw) : raw;
            if (counts[word]++ == 0) {
                order.push_back(word);
            }
        }
    }

    Vocabulary vocab;
    for (const std::string& word : order) {
        if (counts[word] >= min_freq) {
            vocab.add(word);
        }
    }
    return vocab;
}

// ==================== Sentence bank ====================

SentenceBank SentenceBank::read(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open sentence bank: " + path);
    }

    SentenceBank bank;
    std::string line;
    int sentence_id = 0;
    while (std::getline(file, line)) {
        // Line index is the id even when a sentence repeats; the first one wins
        bank.sentence_to_id.emplace(joinWords(splitWhitespace(line)), sentence_id);
        ++sentence_id;
    }
    return bank;
}

int SentenceBank::lookup(const std::string& sentence) const {
    auto it = sentence_to_id.find(joinWords(splitWhitespace(sentence)));
    if (it == sentence_to_id.end()) {
        throw std::runtime_error("Sentence missing from the sentence bank: " + sentence);
    }
    return it->second;
}

void attachSentenceIds(Dataset& dataset, const SentenceBank& bank) {
    for (Example& example : dataset.examples) {
        try {
            example.sentence_id = bank.lookup(joinWords(example.words));
        } catch (const std::runtime_error& e) {
            throw corpusError(dataset.path, example.line_number, e.what());
        }
    }
}

// ==================== Sentence features ====================

SentenceFeatures::SentenceFeatures(Matrix table, size_t max_length, size_t feature_size)
    : table(std::move(table)), max_length(max_length), feature_size(feature_size) {
    if (!this->table.empty() && this->table.getCols() != max_length * feature_size) {
        throw std::invalid_argument("Sentence feature rows must hold max_length x feature_size values");
    }
}

SentenceFeatures SentenceFeatures::read(const std::string& path, size_t max_length,
                                        size_t feature_size) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open sentence features: " + path);
    }

    size_t width = max_length * feature_size;
    std::vector<std::vector<double>> rows;
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::istringstream stream(line);
        std::vector<double> row;
        row.reserve(width);
        double value = 0.0;
        while (stream >> value) {
            row.push_back(value);
        }
        if (!stream.eof()) {
            throw corpusError(path, line_number, "non-numeric sentence feature");
        }
        if (row.size() != width) {
            throw corpusError(path, line_number,
                              "expected " + std::to_string(width) + " values, got " +
                              std::to_string(row.size()));
        }
        rows.push_back(std::move(row));
    }

    Matrix table = rows.empty() ? Matrix(0, width) : Matrix(rows);
    return SentenceFeatures(std::move(table), max_length, feature_size);
}

std::vector<double> SentenceFeatures::tokenFeature(int sentence_id, size_t position) const {
    if (sentence_id < 0 || static_cast<size_t>(sentence_id) >= table.getRows()) {
        throw std::out_of_range("Unknown sentence id: " + std::to_string(sentence_id));
    }
    if (position >= max_length) {
        throw std::out_of_range("Token " + std::to_string(position) +
                                " is beyond the sentence feature length " +
                                std::to_string(max_length));
    }
    const std::vector<double>& row = table[sentence_id];
    auto begin = row.begin() + static_cast<std::ptrdiff_t>(position * feature_size);
    return std::vector<double>(begin, begin + static_cast<std::ptrdiff_t>(feature_size));
}
