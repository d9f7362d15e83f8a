#include "slu/vocabulary.h"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

const char* const Vocabulary::kPad = "<pad>";
const char* const Vocabulary::kUnk = "<unk>";

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

}  // namespace

Vocabulary::Vocabulary(bool with_pad, bool with_unk) : pad_id(-1), unk_id(-1) {
    if (with_pad) pad_id = add(kPad);
    if (with_unk) unk_id = add(kUnk);
}

int Vocabulary::add(const std::string& token) {
    auto it = token_to_id.find(token);
    if (it != token_to_id.end()) {
        return it->second;
    }
    int id = static_cast<int>(id_to_token.size());
    token_to_id.emplace(token, id);
    id_to_token.push_back(token);
    return id;
}

int Vocabulary::getId(const std::string& token) const {
    auto it = token_to_id.find(token);
    return it == token_to_id.end() ? -1 : it->second;
}

int Vocabulary::lookup(const std::string& token) const {
    int id = getId(token);
    if (id >= 0) return id;
    if (unk_id < 0) {
        throw std::out_of_range("Unknown token without <unk> fallback: " + token);
    }
    return unk_id;
}

const std::string& Vocabulary::getToken(int id) const {
    if (id < 0 || id >= static_cast<int>(id_to_token.size())) {
        throw std::out_of_range("Vocabulary id out of range: " + std::to_string(id));
    }
    return id_to_token[id];
}

Vocabulary Vocabulary::readVocabFile(const std::string& path, bool with_pad, bool with_unk) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open vocabulary file: " + path);
    }

    Vocabulary vocab(with_pad, with_unk);
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::string entry = trim(line);
        if (entry.empty()) continue;

        size_t separator = entry.rfind(" : ");
        if (separator == std::string::npos) {
            vocab.add(entry);
            continue;
        }

        std::string token = trim(entry.substr(0, separator));
        int id = 0;
        try {
            id = std::stoi(entry.substr(separator + 3));
        } catch (const std::exception&) {
            throw std::runtime_error(path + ":" + std::to_string(line_number) +
                                     ": malformed vocabulary id");
        }
        if (vocab.contains(token)) {
            if (vocab.getId(token) != id) {
                throw std::runtime_error(path + ":" + std::to_string(line_number) +
                                         ": conflicting id for " + token);
            }
            continue;
        }
        if (id != static_cast<int>(vocab.size())) {
            throw std::runtime_error(path + ":" + std::to_string(line_number) +
                                     ": vocabulary ids must be dense");
        }
        vocab.add(token);
    }
    return vocab;
}

json Vocabulary::toJson() const {
    json data;
    data["tokens"] = id_to_token;
    data["pad_id"] = pad_id;
    data["unk_id"] = unk_id;
    return data;
}

Vocabulary Vocabulary::fromJson(const json& data) {
    Vocabulary vocab(false, false);
    for (const auto& token : data.at("tokens")) {
        vocab.add(token.get<std::string>());
    }
    if (vocab.size() != data.at("tokens").size()) {
        throw std::runtime_error("Duplicate token in saved vocabulary");
    }
    vocab.pad_id = data.at("pad_id").get<int>();
    vocab.unk_id = data.at("unk_id").get<int>();
    return vocab;
}
