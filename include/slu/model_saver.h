#ifndef SLU_MODEL_SAVER_H
#define SLU_MODEL_SAVER_H

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <nlohmann/json.hpp>
#include "matrix.h"
#include "parameter.h"
#include "vocabulary.h"

/**
 * @brief Save and load trained models
 *
 * Directory structure:
 *   model_dir/
 *     ├── config.json       (options the model was trained with)
 *     ├── labels.json       (word, tag and intent vocabularies)
 *     ├── <name>.tag        (encoder, projection and CRF weights)
 *     └── <name>.class      (intent classifier weights)
 *
 * A weight file is a count followed by (name, rows, cols, values) records
 * in ParameterList order.
 */
class ModelSaver {
public:
    /**
     * @brief Save model configuration to JSON
     */
    static bool saveConfig(const std::string& dir, const nlohmann::json& config) {
        std::ofstream file(dir + "/config.json");
        if (!file.is_open()) return false;
        file << config.dump(2);
        return static_cast<bool>(file);
    }

    /**
     * @brief Load model configuration from JSON
     */
    static nlohmann::json loadConfig(const std::string& dir) {
        std::ifstream file(dir + "/config.json");
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open " + dir + "/config.json");
        }
        nlohmann::json config;
        file >> config;
        return config;
    }

    /**
     * @brief Save Matrix to binary file
     */
    static bool saveMatrix(std::ofstream& file, const Matrix& mat) {
        uint64_t rows = mat.getRows();
        uint64_t cols = mat.getCols();

        file.write(reinterpret_cast<const char*>(&rows), sizeof(rows));
        file.write(reinterpret_cast<const char*>(&cols), sizeof(cols));

        for (size_t i = 0; i < mat.getRows(); i++) {
            for (size_t j = 0; j < mat.getCols(); j++) {
                double val = mat.get(i, j);
                file.write(reinterpret_cast<const char*>(&val), sizeof(double));
            }
        }
        return static_cast<bool>(file);
    }

    /**
     * @brief Load a Matrix of a known shape from binary file
     * @throws std::runtime_error if the stored shape differs, before any allocation
     */
    static Matrix loadMatrix(std::ifstream& file, size_t expected_rows, size_t expected_cols) {
        uint64_t rows = 0, cols = 0;
        file.read(reinterpret_cast<char*>(&rows), sizeof(rows));
        file.read(reinterpret_cast<char*>(&cols), sizeof(cols));
        if (!file) {
            throw std::runtime_error("Truncated matrix header");
        }
        if (rows != expected_rows || cols != expected_cols) {
            throw std::runtime_error("shape mismatch (" + std::to_string(rows) + "x" +
                                     std::to_string(cols) + " vs " +
                                     std::to_string(expected_rows) + "x" +
                                     std::to_string(expected_cols) + ")");
        }

        Matrix mat(rows, cols);
        for (size_t i = 0; i < rows; i++) {
            for (size_t j = 0; j < cols; j++) {
                double val;
                file.read(reinterpret_cast<char*>(&val), sizeof(double));
                mat.set(i, j, val);
            }
        }
        if (!file) {
            throw std::runtime_error("Truncated matrix data");
        }
        return mat;
    }

    /**
     * @brief Save named parameter values
     */
    static bool saveParameters(const std::string& path, const ParameterList& params) {
        std::ofstream file(path, std::ios::binary);
        if (!file.is_open()) return false;

        uint64_t count = params.size();
        file.write(reinterpret_cast<const char*>(&count), sizeof(count));
        for (const Parameter* p : params) {
            uint64_t length = p->name.size();
            file.write(reinterpret_cast<const char*>(&length), sizeof(length));
            file.write(p->name.data(), static_cast<std::streamsize>(length));
            if (!saveMatrix(file, p->value)) return false;
        }
        return static_cast<bool>(file);
    }

    /**
     * @brief Load parameter values saved by saveParameters()
     * @throws std::runtime_error if the file is unreadable or its names or
     *         shapes differ from params
     */
    static void loadParameters(const std::string& path, const ParameterList& params) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open model file: " + path);
        }

        uint64_t count = 0;
        file.read(reinterpret_cast<char*>(&count), sizeof(count));
        if (!file || count != params.size()) {
            throw std::runtime_error(path + ": expected " + std::to_string(params.size()) +
                                     " parameters");
        }

        for (Parameter* p : params) {
            uint64_t length = 0;
            file.read(reinterpret_cast<char*>(&length), sizeof(length));
            if (!file || length > 4096) {
                throw std::runtime_error(path + ": corrupt parameter record");
            }
            std::string name(length, '\0');
            file.read(&name[0], static_cast<std::streamsize>(length));
            if (!file || name != p->name) {
                throw std::runtime_error(path + ": expected parameter " + p->name +
                                         ", found " + name);
            }

            try {
                p->value = loadMatrix(file, p->value.getRows(), p->value.getCols());
            } catch (const std::runtime_error& e) {
                throw std::runtime_error(path + ": " + p->name + ": " + e.what());
            }
        }
    }

    /**
     * @brief Save the word, tag and intent vocabularies
     */
    static bool saveLabels(const std::string& dir,
                           const Vocabulary& words,
                           const Vocabulary& tags,
                           const Vocabulary& intents) {
        nlohmann::json labels_json;
        labels_json["word"] = words.toJson();
        labels_json["tag"] = tags.toJson();
        labels_json["intent"] = intents.toJson();

        std::ofstream file(dir + "/labels.json");
        if (!file.is_open()) return false;
        file << labels_json.dump(2);
        return static_cast<bool>(file);
    }

    /**
     * @brief Load the vocabularies saved by saveLabels()
     * @return (words, tags, intents)
     */
    static std::tuple<Vocabulary, Vocabulary, Vocabulary> loadLabels(const std::string& dir) {
        std::ifstream file(dir + "/labels.json");
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open " + dir + "/labels.json");
        }

        nlohmann::json labels_json;
        file >> labels_json;

        return {Vocabulary::fromJson(labels_json.at("word")),
                Vocabulary::fromJson(labels_json.at("tag")),
                Vocabulary::fromJson(labels_json.at("intent"))};
    }
};

#endif // SLU_MODEL_SAVER_H
