#ifndef SLU_VOCABULARY_H
#define SLU_VOCABULARY_H

#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Dense token ⇄ id bijection
 *
 * Ids are contiguous from 0. Unless disabled, "<pad>" is id 0 and "<unk>"
 * is id 1, ahead of every file entry.
 */
class Vocabulary {
private:
    std::unordered_map<std::string, int> token_to_id;
    std::vector<std::string> id_to_token;
    int pad_id;
    int unk_id;

public:
    static const char* const kPad;
    static const char* const kUnk;

    /**
     * @brief Constructor
     * @param with_pad Reserve "<pad>"
     * @param with_unk Reserve "<unk>"
     */
    explicit Vocabulary(bool with_pad = true, bool with_unk = true);

    /**
     * @brief Add a token if absent
     * @return The token's id
     */
    int add(const std::string& token);

    /**
     * @brief Id of a token, or -1 when absent
     */
    int getId(const std::string& token) const;

    /**
     * @brief Id of a token, falling back to "<unk>"
     * @throws std::out_of_range when absent and there is no "<unk>"
     */
    int lookup(const std::string& token) const;

    /**
     * @brief Token of an id
     * @throws std::out_of_range for an unknown id
     */
    const std::string& getToken(int id) const;

    bool contains(const std::string& token) const { return token_to_id.count(token) > 0; }
    size_t size() const { return id_to_token.size(); }
    int getPadId() const { return pad_id; }
    int getUnkId() const { return unk_id; }
    const std::vector<std::string>& getTokens() const { return id_to_token; }

    /**
     * @brief Read a label list: one label per line, or "label : id" lines
     *
     * Explicit ids must equal the next free id so the mapping stays dense.
     * @throws std::runtime_error if the file cannot be read or is inconsistent
     */
    static Vocabulary readVocabFile(const std::string& path,
                                    bool with_pad = true, bool with_unk = true);

    nlohmann::json toJson() const;
    static Vocabulary fromJson(const nlohmann::json& data);
};

#endif // SLU_VOCABULARY_H
