#include <gtest/gtest.h>
#include "slu/options.h"
#include "test_utils.h"

namespace {

Options parse(std::vector<const char*> args) {
    args.insert(args.begin(), "slu_train");
    return Options::parseCommandLine(static_cast<int>(args.size()), args.data());
}

Options validOptions() {
    Options options;
    options.task_st = "slot_tagger_with_crf";
    options.task_sc = "2tails";
    options.dataset = "atis";
    options.dataroot = "data/atis";
    return options;
}

}  // namespace

// ==================== Parsing ====================

TEST(Options, Defaults) {
    Options options;
    EXPECT_EQ(options.sc_type, "single_cls_CE");
    EXPECT_DOUBLE_EQ(options.st_weight, 0.5);
    EXPECT_EQ(options.batch_size, 64);
    EXPECT_EQ(options.optim, "sgd");
    EXPECT_EQ(options.device_id, -1);
    EXPECT_EQ(options.random_seed, 999);
    EXPECT_FALSE(options.bidirectional);
    EXPECT_EQ(options.effectiveTestBatchSize(), 64);
}

TEST(Options, FlagsAndAliases) {
    Options options = parse({"--task_st", "slot_tagger", "--task_sc", "maxPooling",
                             "--bidirectional", "--batchSize", "16", "--lr", "0.5",
                             "--noStdout", "--test_batch_size", "8"});
    EXPECT_EQ(options.task_st, "slot_tagger");
    EXPECT_EQ(options.task_sc, "maxPooling");
    EXPECT_TRUE(options.bidirectional);
    EXPECT_TRUE(options.no_stdout);
    EXPECT_EQ(options.batch_size, 16);
    EXPECT_DOUBLE_EQ(options.lr, 0.5);
    EXPECT_EQ(options.effectiveTestBatchSize(), 8);
}

TEST(Options, ConfigFileThenOverrides) {
    TempDir dir;
    writeFile(dir.file("config.json"),
              R"({"task_st": "slot_tagger", "hidden_size": 32, "optim": "adam", "lr": 0.001})");
    std::string config = dir.file("config.json");

    Options options = parse({"--hidden_size", "64", "--config", config.c_str()});
    EXPECT_EQ(options.task_st, "slot_tagger");
    EXPECT_EQ(options.optim, "adam");
    EXPECT_EQ(options.hidden_size, 64);
    EXPECT_DOUBLE_EQ(options.lr, 0.001);
}

TEST(Options, BadCommandLinesThrow) {
    EXPECT_THROW(parse({"--no_such_option", "1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--batch_size"}), std::invalid_argument);
    EXPECT_THROW(parse({"--batch_size", "12x"}), std::invalid_argument);
    EXPECT_THROW(parse({"--lr", "fast"}), std::invalid_argument);
    EXPECT_THROW(parse({"train.txt"}), std::invalid_argument);
    EXPECT_THROW(parse({"--config"}), std::invalid_argument);
    EXPECT_THROW(parse({"--config", "/nonexistent/config.json"}), std::runtime_error);
}

TEST(Options, UpdateRejectsWrongTypes) {
    Options options;
    EXPECT_THROW(options.update(nlohmann::json{{"batch_size", "big"}}), std::invalid_argument);
    EXPECT_THROW(options.update(nlohmann::json{{"bidirectional", 1}}), std::invalid_argument);
    EXPECT_THROW(options.update(nlohmann::json{{"unknown", 1}}), std::invalid_argument);
    EXPECT_THROW(options.update(nlohmann::json::array()), std::invalid_argument);

    options.update(nlohmann::json{{"st_weight", 1}});
    EXPECT_DOUBLE_EQ(options.st_weight, 1.0);
}

// ==================== Validation ====================

TEST(Options, ValidConfigurationPasses) {
    EXPECT_NO_THROW(validOptions().validate());
}

TEST(Options, ValidationErrors) {
    Options options = validOptions();
    options.device_id = 0;
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options = validOptions();
    options.st_weight = 0.0;
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options = validOptions();
    options.task_sc = "bagOfWords";
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options = validOptions();
    options.testing = true;
    EXPECT_THROW(options.validate(), std::invalid_argument);
    options.read_model = "exp/model";
    options.out_path = "out";
    EXPECT_NO_THROW(options.validate());

    options = validOptions();
    options.read_sen2idx = "sen2idx";
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options = validOptions();
    options.optim = "lbfgs";
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options = validOptions();
    options.dataset.clear();
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

// ==================== Derived settings ====================

TEST(Options, TaskSwitches) {
    Options options = validOptions();
    EXPECT_TRUE(options.useCRF());
    EXPECT_FALSE(options.multiLabel());
    EXPECT_TRUE(options.intentEnabled());
    EXPECT_EQ(options.intentStrategy(), IntentStrategy::TwoTails);

    options.st_weight = 1.0;
    EXPECT_FALSE(options.intentEnabled());
    EXPECT_EQ(options.intentStrategy(), IntentStrategy::None);

    options.st_weight = 0.5;
    options.task_sc = "none";
    EXPECT_EQ(options.intentStrategy(), IntentStrategy::None);
}

TEST(Options, ExperimentPathEncodesHyperParameters) {
    Options options = validOptions();
    options.experiment = "runs";
    options.bidirectional = true;
    std::string path = options.experimentPath();

    EXPECT_EQ(path.rfind("runs/model_slot_tagger_with_crf__and__2tails__data_atis", 0), 0u) << path;
    EXPECT_NE(path.find("__bidir_True"), std::string::npos);
    EXPECT_NE(path.find("__lr_0.01"), std::string::npos);
    EXPECT_NE(path.find("__alpha_0.5"), std::string::npos);
    EXPECT_EQ(path.find("__preSenEmb_in"), std::string::npos);

    options.task_sc = "none";
    EXPECT_EQ(options.experimentPath().find("__alpha_"), std::string::npos);

    options.testing = true;
    options.out_path = "decoded";
    EXPECT_EQ(options.experimentPath(), "decoded");
}
