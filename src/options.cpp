#include "slu/options.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

using json = nlohmann::json;

namespace {

// Spellings accepted on the command line besides the canonical keys
const std::unordered_map<std::string, std::string>& keyAliases() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"batchSize", "batch_size"},
        {"test_batchSize", "test_batch_size"},
        {"deviceId", "device_id"},
        {"noStdout", "no_stdout"},
    };
    return aliases;
}

std::string canonicalKey(const std::string& key) {
    auto it = keyAliases().find(key);
    return it == keyAliases().end() ? key : it->second;
}

bool sameKind(const json& expected, const json& given) {
    if (expected.is_boolean()) return given.is_boolean();
    if (expected.is_string()) return given.is_string();
    if (expected.is_number_integer()) return given.is_number_integer();
    if (expected.is_number()) return given.is_number();
    return false;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string formatNumber(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

}  // namespace

// ==================== JSON ====================

json Options::toJson() const {
    return json{
        {"task_st", task_st},
        {"task_sc", task_sc},
        {"sc_type", sc_type},
        {"st_weight", st_weight},
        {"dataset", dataset},
        {"dataroot", dataroot},
        {"save_model", save_model},
        {"testing", testing},
        {"read_model", read_model},
        {"out_path", out_path},
        {"read_sen2idx", read_sen2idx},
        {"read_input_sen2vec", read_input_sen2vec},
        {"sen_max_len", sen_max_len},
        {"sen_feature_size", sen_feature_size},
        {"emb_size", emb_size},
        {"hidden_size", hidden_size},
        {"num_layers", num_layers},
        {"bidirectional", bidirectional},
        {"device_id", device_id},
        {"random_seed", random_seed},
        {"lr", lr},
        {"dropout", dropout},
        {"batch_size", batch_size},
        {"test_batch_size", test_batch_size},
        {"init_weight", init_weight},
        {"max_norm", max_norm},
        {"max_epoch", max_epoch},
        {"optim", optim},
        {"experiment", experiment},
        {"min_word_freq", min_word_freq},
        {"lowercase", lowercase},
        {"no_stdout", no_stdout},
    };
}

void Options::update(const json& values) {
    if (!values.is_object()) {
        throw std::invalid_argument("Options must be a JSON object");
    }

    json merged = toJson();
    for (const auto& [raw_key, value] : values.items()) {
        std::string key = canonicalKey(raw_key);
        if (!merged.contains(key)) {
            throw std::invalid_argument("Unknown option: " + raw_key);
        }
        if (!sameKind(merged[key], value)) {
            throw std::invalid_argument("Option " + raw_key + " expects a " +
                                        std::string(merged[key].type_name()) + " value");
        }
        merged[key] = value;
    }

    task_st = merged["task_st"].get<std::string>();
    task_sc = merged["task_sc"].get<std::string>();
    sc_type = merged["sc_type"].get<std::string>();
    st_weight = merged["st_weight"].get<double>();
    dataset = merged["dataset"].get<std::string>();
    dataroot = merged["dataroot"].get<std::string>();
    save_model = merged["save_model"].get<std::string>();
    testing = merged["testing"].get<bool>();
    read_model = merged["read_model"].get<std::string>();
    out_path = merged["out_path"].get<std::string>();
    read_sen2idx = merged["read_sen2idx"].get<std::string>();
    read_input_sen2vec = merged["read_input_sen2vec"].get<std::string>();
    sen_max_len = merged["sen_max_len"].get<int>();
    sen_feature_size = merged["sen_feature_size"].get<int>();
    emb_size = merged["emb_size"].get<int>();
    hidden_size = merged["hidden_size"].get<int>();
    num_layers = merged["num_layers"].get<int>();
    bidirectional = merged["bidirectional"].get<bool>();
    device_id = merged["device_id"].get<int>();
    random_seed = merged["random_seed"].get<int>();
    lr = merged["lr"].get<double>();
    dropout = merged["dropout"].get<double>();
    batch_size = merged["batch_size"].get<int>();
    test_batch_size = merged["test_batch_size"].get<int>();
    init_weight = merged["init_weight"].get<double>();
    max_norm = merged["max_norm"].get<double>();
    max_epoch = merged["max_epoch"].get<int>();
    optim = merged["optim"].get<std::string>();
    experiment = merged["experiment"].get<std::string>();
    min_word_freq = merged["min_word_freq"].get<int>();
    lowercase = merged["lowercase"].get<bool>();
    no_stdout = merged["no_stdout"].get<bool>();
}

// ==================== Command line ====================

Options Options::parseCommandLine(int argc, const char* const argv[]) {
    Options options;

    // The config file is applied first so that flags always override it
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) != "--config") continue;
        if (i + 1 >= argc) {
            throw std::invalid_argument("--config needs a file name");
        }
        std::ifstream file(argv[i + 1]);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + std::string(argv[i + 1]));
        }
        json config;
        try {
            file >> config;
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Invalid config file " + std::string(argv[i + 1]) +
                                     ": " + e.what());
        }
        options.update(config);
    }

    json defaults = options.toJson();
    json overrides = json::object();
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }

        std::string key = canonicalKey(arg.substr(2));
        if (!defaults.contains(key)) {
            throw std::invalid_argument("Unknown option: " + arg);
        }

        const json& expected = defaults[key];
        if (expected.is_boolean()) {
            overrides[key] = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("Option " + arg + " needs a value");
        }

        std::string value = argv[++i];
        try {
            if (expected.is_string()) {
                overrides[key] = value;
            } else if (expected.is_number_integer()) {
                size_t used = 0;
                int number = std::stoi(value, &used);
                if (used != value.size()) throw std::invalid_argument(value);
                overrides[key] = number;
            } else {
                size_t used = 0;
                double number = std::stod(value, &used);
                if (used != value.size()) throw std::invalid_argument(value);
                overrides[key] = number;
            }
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Option " + arg + " expects a " +
                                        std::string(expected.type_name()) + ", got " + value);
        }
    }
    options.update(overrides);
    return options;
}

// ==================== Validation ====================

void Options::validate() const {
    if (task_st != "slot_tagger" && task_st != "slot_tagger_with_crf") {
        throw std::invalid_argument("task_st must be slot_tagger or slot_tagger_with_crf, got '" +
                                    task_st + "'");
    }
    parseIntentStrategy(task_sc);
    if (sc_type != "single_cls_CE" && sc_type != "multi_cls_BCE") {
        throw std::invalid_argument("sc_type must be single_cls_CE or multi_cls_BCE, got '" +
                                    sc_type + "'");
    }
    if (!(st_weight > 0.0 && st_weight <= 1.0)) {
        throw std::invalid_argument("st_weight must be in (0, 1], got " + formatNumber(st_weight));
    }
    if (dataset.empty() || dataroot.empty()) {
        throw std::invalid_argument("dataset and dataroot are required");
    }
    if (testing != !read_model.empty() || testing != !out_path.empty()) {
        throw std::invalid_argument("testing, read_model and out_path must be given together");
    }
    if (device_id != -1) {
        throw std::invalid_argument("Only the CPU (device_id -1) is supported, got device_id " +
                                    std::to_string(device_id));
    }
    if (read_sen2idx.empty() != read_input_sen2vec.empty()) {
        throw std::invalid_argument("read_sen2idx and read_input_sen2vec must be given together");
    }
    if (useSentenceFeatures() && (sen_max_len <= 0 || sen_feature_size <= 0)) {
        throw std::invalid_argument("Sentence features need positive sen_max_len and sen_feature_size");
    }
    if (emb_size <= 0 || hidden_size <= 0 || num_layers <= 0) {
        throw std::invalid_argument("emb_size, hidden_size and num_layers must be positive");
    }
    if (batch_size <= 0) {
        throw std::invalid_argument("batch_size must be positive");
    }
    if (test_batch_size < 0) {
        throw std::invalid_argument("test_batch_size must not be negative");
    }
    if (!(dropout >= 0.0 && dropout < 1.0)) {
        throw std::invalid_argument("dropout must be in [0, 1)");
    }
    if (!(lr > 0.0)) {
        throw std::invalid_argument("lr must be positive");
    }
    if (init_weight < 0.0 || max_norm < 0.0 || max_epoch < 0) {
        throw std::invalid_argument("init_weight, max_norm and max_epoch must not be negative");
    }
    if (min_word_freq < 1) {
        throw std::invalid_argument("min_word_freq must be at least 1");
    }
    std::string optimizer = toLower(optim);
    if (optimizer != "sgd" && optimizer != "adam" && optimizer != "adadelta" &&
        optimizer != "rmsprop") {
        throw std::invalid_argument("Unknown optimizer: " + optim);
    }
}

bool Options::intentEnabled() const {
    return task_sc != "none" && st_weight < 1.0;
}

IntentStrategy Options::intentStrategy() const {
    return intentEnabled() ? parseIntentStrategy(task_sc) : IntentStrategy::None;
}

std::string Options::experimentPath() const {
    if (testing) {
        return out_path;
    }

    std::string task = task_st;
    if (intentEnabled()) {
        task += "__and__" + task_sc;
    }

    std::ostringstream path;
    path << experiment << "/"
         << "model_" << task
         << "__data_" << dataset
         << "__sc_" << sc_type
         << "__bidir_" << (bidirectional ? "True" : "False")
         << "__layers_" << num_layers
         << "__emb_" << emb_size
         << "__hid_" << hidden_size
         << "__drop_" << formatNumber(dropout)
         << "__optim_" << optim
         << "__lr_" << formatNumber(lr)
         << "__mn_" << formatNumber(max_norm)
         << "__me_" << max_epoch
         << "__bs_" << batch_size
         << "__seed_" << random_seed;
    if (intentEnabled()) {
        path << "__alpha_" << formatNumber(st_weight);
    }
    if (useSentenceFeatures()) {
        path << "__preSenEmb_in";
    }
    return path.str();
}
