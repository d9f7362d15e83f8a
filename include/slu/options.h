#ifndef SLU_OPTIONS_H
#define SLU_OPTIONS_H

#include "intent_classifier.h"
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Run configuration
 *
 * Filled from defaults, then an optional JSON file (--config), then
 * "--key value" overrides. Boolean keys are flags and take no value.
 */
struct Options {
    // Tasks
    std::string task_st;                      // slot_tagger | slot_tagger_with_crf
    std::string task_sc;                      // none | 2tails | maxPooling | hiddenCNN | hiddenAttention
    std::string sc_type = "single_cls_CE";    // single_cls_CE | multi_cls_BCE
    double st_weight = 0.5;                   // α, weight of the tagging loss

    // Data and checkpoints
    std::string dataset;
    std::string dataroot;
    std::string save_model = "model";
    bool testing = false;
    std::string read_model;
    std::string out_path;

    // Sentence features
    std::string read_sen2idx;
    std::string read_input_sen2vec;
    int sen_max_len = 76;
    int sen_feature_size = 0;

    // Encoder
    int emb_size = 100;
    int hidden_size = 100;
    int num_layers = 1;
    bool bidirectional = false;

    int device_id = -1;
    int random_seed = 999;

    // Training
    double lr = 0.01;
    double dropout = 0.0;
    int batch_size = 64;
    int test_batch_size = 0;                  // 0 = batch_size
    double init_weight = 0.2;
    double max_norm = 5.0;
    int max_epoch = 50;
    std::string optim = "sgd";
    std::string experiment = "exp";

    // Word vocabulary
    int min_word_freq = 2;
    bool lowercase = false;

    bool no_stdout = false;

    /**
     * @brief Overlay the keys present in a JSON object
     * @throws std::invalid_argument for an unknown key or a value of the wrong type
     */
    void update(const nlohmann::json& values);

    nlohmann::json toJson() const;

    /**
     * @brief Parse argv ("--config file.json" first, then overrides)
     * @throws std::invalid_argument on unknown keys or missing values
     * @throws std::runtime_error if the config file cannot be read
     */
    static Options parseCommandLine(int argc, const char* const argv[]);

    /**
     * @brief Check every constraint before any data is loaded
     * @throws std::invalid_argument describing the first violation
     */
    void validate() const;

    bool useCRF() const { return task_st == "slot_tagger_with_crf"; }
    bool multiLabel() const { return sc_type == "multi_cls_BCE"; }

    /**
     * @brief False when task_sc is "none" or st_weight is 1
     */
    bool intentEnabled() const;

    /**
     * @brief Intent strategy, None when the intent task is disabled
     */
    IntentStrategy intentStrategy() const;

    int effectiveTestBatchSize() const { return test_batch_size > 0 ? test_batch_size : batch_size; }

    bool useSentenceFeatures() const { return !read_input_sen2vec.empty(); }

    /**
     * @brief Output directory: out_path when testing, otherwise
     *        <experiment>/<hyper-parameter string>
     */
    std::string experimentPath() const;
};

#endif // SLU_OPTIONS_H
