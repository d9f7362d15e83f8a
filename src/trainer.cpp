#include "slu/trainer.h"
#include "slu/model_saver.h"
#include "slu/random.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace {

std::string joinIntents(const std::vector<std::string>& intents) {
    std::string joined;
    for (size_t i = 0; i < intents.size(); ++i) {
        if (i > 0) joined += ';';
        joined += intents[i];
    }
    return joined;
}

std::string describeEval(const EvalResult& result) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2)
        << "Loss : (" << result.tag_loss << ", " << result.intent_loss << ")"
        << "\tP: " << result.slot.precision << ", R: " << result.slot.recall
        << ", Fscore : " << result.slot.f1
        << "\tcls-P: " << result.intent.precision << ", cls-R: " << result.intent.recall
        << ", cls-F1 : " << result.intent.f1;
    return out.str();
}

std::string describeScores(const EvalResult& result) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2)
        << "P: " << result.slot.precision << ", R: " << result.slot.recall
        << ", F1 : " << result.slot.f1
        << ", cls-P: " << result.intent.precision << ", cls-R: " << result.intent.recall
        << ", cls-F1 : " << result.intent.f1;
    return out.str();
}

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

JointTrainer::JointTrainer(const Options& options, Logger& logger,
                           Vocabulary words, Vocabulary tags, Vocabulary intents,
                           std::shared_ptr<const SentenceFeatures> sentence_features)
    : options(options), logger(logger),
      word_vocab(std::move(words)), tag_vocab(std::move(tags)), intent_vocab(std::move(intents)) {
    auto encoder = std::make_unique<SequenceEncoder>(
        word_vocab.size(), static_cast<size_t>(options.emb_size), word_vocab.getPadId(),
        static_cast<size_t>(options.hidden_size), static_cast<size_t>(options.num_layers),
        options.bidirectional, options.dropout, std::move(sentence_features));

    tagger = std::make_unique<SlotTagger>(std::move(encoder), tag_vocab, options.useCRF());
    classifier = createIntentClassifier(options.intentStrategy(),
                                        static_cast<size_t>(options.hidden_size),
                                        options.bidirectional, intent_vocab.size());

    if (options.multiLabel()) {
        intent_loss = std::make_unique<BCEWithLogitsLoss>();
    } else {
        intent_loss = std::make_unique<WeightedNLLLoss>();
    }

    if (!options.testing && options.init_weight > 0.0) {
        tagger->initializeWeights(options.init_weight);
        if (classifier) classifier->initializeWeights(options.init_weight);
    }

    optimizer = createOptimizer(options.optim, options.lr);
}

ParameterList JointTrainer::parameters() {
    ParameterList params = tagger->parameters();
    if (classifier) {
        for (Parameter* p : classifier->parameters()) params.push_back(p);
    }
    return params;
}

void JointTrainer::setData(Dataset train, Dataset valid, Dataset test) {
    train_data = std::move(train);
    valid_data = std::move(valid);
    test_data = std::move(test);
    train_index.resize(train_data.size());
    std::iota(train_index.begin(), train_index.end(), 0);
}

Batch JointTrainer::batchAt(const Dataset& data, const std::vector<size_t>& index,
                            size_t offset, size_t batch_size) const {
    return makeBatch(data, index, offset, batch_size,
                     word_vocab.getPadId(), tag_vocab.getId(Vocabulary::kPad));
}

// ==================== Loss and backward ====================

BatchLoss JointTrainer::forwardLosses(const Batch& batch, bool training, TaggerOutput& output,
                                      Matrix& intent_logits) {
    BatchLoss loss;
    output = tagger->forward(batch, training);
    loss.tag = tagger->loss(output, batch);

    if (classifier) {
        intent_logits = classifier->forward(output.encoded);
        Matrix targets = intentTargetMatrix(batch, intent_vocab.size(), options.multiLabel());
        loss.intent = intent_loss->calculate(intent_logits, targets);
    }
    return loss;
}

BatchLoss JointTrainer::computeLoss(const Batch& batch) {
    TaggerOutput output;
    Matrix intent_logits;
    return forwardLosses(batch, false, output, intent_logits);
}

BatchLoss JointTrainer::trainBatch(const Batch& batch) {
    ParameterList params = parameters();
    zeroGradients(params);

    TaggerOutput output;
    Matrix intent_logits;
    BatchLoss loss = forwardLosses(batch, true, output, intent_logits);

    // total = α·L_tag + (1−α)·L_intent
    double alpha = tagWeight();
    std::vector<Matrix> grad_hidden = tagger->backward(output, batch, alpha);

    if (classifier) {
        Matrix targets = intentTargetMatrix(batch, intent_vocab.size(), options.multiLabel());
        Matrix grad_logits = intent_loss->gradient(intent_logits, targets) * (1.0 - alpha);
        std::vector<Matrix> grad_from_intent = classifier->backward(grad_logits);
        for (size_t t = 0; t < grad_hidden.size(); ++t) {
            grad_hidden[t] += grad_from_intent[t];
        }
    }

    tagger->backwardEncoder(grad_hidden);

    if (options.max_norm > 0.0) {
        clipGradNorm(params, options.max_norm);
    }
    optimizer->step(params);
    zeroGradients(params);
    return loss;
}

// ==================== Training ====================

std::pair<double, double> JointTrainer::trainEpoch(int epoch) {
    auto start = std::chrono::steady_clock::now();
    std::shuffle(train_index.begin(), train_index.end(), Random::generator());

    size_t batch_size = static_cast<size_t>(options.batch_size);
    size_t total = train_index.size();
    size_t piece = std::max<size_t>(1, total / 10 / batch_size) * batch_size;

    double tag_sum = 0.0;
    double intent_sum = 0.0;
    size_t batches = 0;
    for (size_t offset = 0; offset < total; offset += batch_size) {
        Batch batch = batchAt(train_data, train_index, offset, batch_size);
        BatchLoss loss = trainBatch(batch);

        tag_sum += loss.tag / static_cast<double>(batch.totalTokens());
        intent_sum += loss.intent / static_cast<double>(batch.size());
        ++batches;

        if (offset % piece == 0) {
            std::ostringstream message;
            message << "[learning] epoch " << epoch << " >> " << std::fixed << std::setprecision(2)
                    << 100.0 * static_cast<double>(std::min(total, offset + batch_size)) /
                           static_cast<double>(total)
                    << "% completed in " << secondsSince(start) << " (sec) <<";
            logger.progress(message.str());
        }
    }

    if (batches == 0) {
        return {0.0, 0.0};
    }
    return {tag_sum / static_cast<double>(batches), intent_sum / static_cast<double>(batches)};
}

// ==================== Evaluation ====================

std::string JointTrainer::formatLine(const Batch& batch, size_t row,
                                     const std::vector<int>& predicted_tags,
                                     const std::vector<int>& predicted_intents,
                                     bool online) const {
    std::ostringstream line;
    if (online) {
        line << batch.line_numbers[row] << " : ";
    }

    for (size_t t = 0; t < batch.lengths[row]; ++t) {
        if (t > 0) line << ' ';
        line << batch.words[row][t] << ':' << batch.raw_tags[row][t] << ':'
             << tag_vocab.getToken(predicted_tags[t]);
    }

    std::vector<std::string> predicted_names;
    for (int id : predicted_intents) {
        predicted_names.push_back(intent_vocab.getToken(id));
    }
    std::string gold = classifier ? joinIntents(batch.raw_intents[row]) : "";
    line << " <=> " << gold << " <=> " << joinIntents(predicted_names);
    return line.str();
}

EvalResult JointTrainer::decode(const Dataset& data, const std::string& output_path, bool online) {
    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write evaluation output: " + output_path);
    }

    std::vector<size_t> index(data.size());
    std::iota(index.begin(), index.end(), 0);
    size_t batch_size = static_cast<size_t>(options.effectiveTestBatchSize());

    ScoreCounter slot_counter;
    ScoreCounter intent_counter;
    double tag_sum = 0.0;
    double intent_sum = 0.0;
    size_t batches = 0;

    for (size_t offset = 0; offset < index.size(); offset += batch_size) {
        Batch batch = batchAt(data, index, offset, batch_size);

        TaggerOutput output;
        Matrix intent_logits;
        BatchLoss loss = forwardLosses(batch, false, output, intent_logits);
        tag_sum += loss.tag / static_cast<double>(batch.totalTokens());
        intent_sum += loss.intent / static_cast<double>(batch.size());
        ++batches;

        std::vector<std::vector<int>> predicted_tags = tagger->decode(output, batch);
        std::vector<std::vector<int>> predicted_intents(batch.size());
        if (classifier) {
            predicted_intents = predictIntents(intent_logits, options.multiLabel());
        }

        for (size_t b = 0; b < batch.size(); ++b) {
            std::vector<std::string> tag_names;
            for (int id : predicted_tags[b]) {
                tag_names.push_back(tag_vocab.getToken(id));
            }
            scoreSlotTags(tag_names, batch.raw_tags[b], slot_counter);

            if (classifier) {
                std::vector<std::string> intent_names;
                for (int id : predicted_intents[b]) {
                    intent_names.push_back(intent_vocab.getToken(id));
                }
                if (options.multiLabel()) {
                    scoreIntentSets(intent_names, batch.raw_intents[b], intent_counter);
                } else {
                    scoreSingleIntent(intent_names.front(), batch.raw_intents[b], intent_counter);
                }
            }

            file << formatLine(batch, b, predicted_tags[b], predicted_intents[b], online) << '\n';
        }
    }

    if (!file) {
        throw std::runtime_error("Failed writing evaluation output: " + output_path);
    }

    EvalResult result;
    if (batches > 0) {
        result.tag_loss = tag_sum / static_cast<double>(batches);
        result.intent_loss = intent_sum / static_cast<double>(batches);
    }
    result.slot = slot_counter.snapshot();
    result.intent = intent_counter.snapshot();
    return result;
}

void JointTrainer::train(const std::string& exp_path) {
    logger.info("Training starts at " + Logger::timestamp());

    double best_score = -1.0;
    int best_epoch = -1;
    EvalResult best_valid;
    EvalResult best_test;

    for (int epoch = 0; epoch < options.max_epoch; ++epoch) {
        auto start = std::chrono::steady_clock::now();
        auto [tag_loss, class_loss] = trainEpoch(epoch);

        std::ostringstream training;
        training << std::fixed << "Training:\tEpoch : " << epoch
                 << "\tTime : " << std::setprecision(4) << secondsSince(start) << "s"
                 << std::setprecision(2) << "\tLoss of tag : " << tag_loss
                 << "\tLoss of class : " << class_loss;
        logger.info(training.str());

        start = std::chrono::steady_clock::now();
        EvalResult valid = decode(valid_data, exp_path + "/valid.iter" + std::to_string(epoch), false);
        std::ostringstream validation;
        validation << std::fixed << "Validation:\tEpoch : " << epoch
                   << "\tTime : " << std::setprecision(4) << secondsSince(start) << "s\t"
                   << describeEval(valid);
        logger.info(validation.str());

        start = std::chrono::steady_clock::now();
        EvalResult test = decode(test_data, exp_path + "/test.iter" + std::to_string(epoch), false);
        std::ostringstream evaluation;
        evaluation << std::fixed << "Evaluation:\tEpoch : " << epoch
                   << "\tTime : " << std::setprecision(4) << secondsSince(start) << "s\t"
                   << describeEval(test);
        logger.info(evaluation.str());

        double alpha = tagWeight();
        double score = classifier ? alpha * valid.slot.f1 + (1.0 - alpha) * valid.intent.f1
                                  : valid.slot.f1;
        if (score > best_score) {
            saveModel(exp_path + "/" + options.save_model);
            best_score = score;
            best_epoch = epoch;
            best_valid = valid;
            best_test = test;
            logger.info("NEW BEST:\tEpoch : " + std::to_string(epoch) + "\tbest valid " +
                        describeScores(valid) + ";\ttest " + describeScores(test));
        }
    }

    if (best_epoch >= 0) {
        logger.info("BEST RESULT: \tEpoch : " + std::to_string(best_epoch) + "\tbest valid " +
                    describeScores(best_valid) + "\tbest test " + describeScores(best_test));
    }
}

EvalResult JointTrainer::test(const std::string& out_path) {
    auto start = std::chrono::steady_clock::now();
    EvalResult result = decode(test_data, out_path + "/test.eval", true);

    std::ostringstream evaluation;
    evaluation << std::fixed << "Evaluation:\tTime : " << std::setprecision(4)
               << secondsSince(start) << "s\t" << describeEval(result);
    logger.info(evaluation.str());
    return result;
}

// ==================== Checkpoints ====================

void JointTrainer::saveModel(const std::string& prefix) {
    std::string dir = std::filesystem::path(prefix).parent_path().string();
    if (dir.empty()) dir = ".";

    if (!ModelSaver::saveConfig(dir, options.toJson()) ||
        !ModelSaver::saveLabels(dir, word_vocab, tag_vocab, intent_vocab) ||
        !ModelSaver::saveParameters(prefix + ".tag", tagger->parameters())) {
        throw std::runtime_error("Cannot save the model to " + prefix);
    }
    if (classifier && !ModelSaver::saveParameters(prefix + ".class", classifier->parameters())) {
        throw std::runtime_error("Cannot save the intent classifier to " + prefix + ".class");
    }
}

void JointTrainer::loadModel(const std::string& prefix) {
    ModelSaver::loadParameters(prefix + ".tag", tagger->parameters());
    if (classifier) {
        ModelSaver::loadParameters(prefix + ".class", classifier->parameters());
    }
}

// ==================== Whole run ====================

namespace {

// Keys that fix the shape of a saved model
const char* const kModelKeys[] = {
    "task_st", "task_sc", "sc_type", "st_weight", "emb_size", "hidden_size", "num_layers",
    "bidirectional", "sen_max_len", "sen_feature_size", "min_word_freq", "lowercase",
};

}  // namespace

void runJointSLU(const Options& requested) {
    requested.validate();

    Options options = requested;
    Vocabulary words, tags, intents;
    std::string model_dir;

    if (options.testing) {
        model_dir = std::filesystem::path(options.read_model).parent_path().string();
        if (model_dir.empty()) model_dir = ".";

        nlohmann::json saved = ModelSaver::loadConfig(model_dir);
        nlohmann::json model_options = nlohmann::json::object();
        for (const char* key : kModelKeys) {
            if (saved.contains(key)) model_options[key] = saved[key];
        }
        options.update(model_options);
        options.validate();
    }

    std::string exp_path = options.experimentPath();
    std::filesystem::create_directories(exp_path);

    Logger logger(exp_path + (options.testing ? "/log_test.txt" : "/log_train.txt"),
                  !options.no_stdout);
    logger.info(options.toJson().dump());
    logger.info("Experiment path: " + exp_path);
    logger.info(Logger::timestamp());
    logger.info("CPU is used.");

    Random::seed(static_cast<unsigned int>(options.random_seed));

    if (options.testing) {
        std::tie(words, tags, intents) = ModelSaver::loadLabels(model_dir);
    } else {
        tags = Vocabulary::readVocabFile(options.dataroot + "/vocab.slot");
        intents = Vocabulary::readVocabFile(options.dataroot + "/vocab.intent");
        words = buildWordVocabulary(options.dataroot + "/train",
                                    static_cast<size_t>(options.min_word_freq), options.lowercase);
    }
    logger.info("Vocab size: " + std::to_string(words.size()) + " " +
                std::to_string(tags.size()) + " " + std::to_string(intents.size()));

    std::shared_ptr<const SentenceFeatures> sentence_features;
    SentenceBank bank;
    if (options.useSentenceFeatures()) {
        bank = SentenceBank::read(options.read_sen2idx);
        sentence_features = std::make_shared<const SentenceFeatures>(SentenceFeatures::read(
            options.read_input_sen2vec, static_cast<size_t>(options.sen_max_len),
            static_cast<size_t>(options.sen_feature_size)));
        logger.info("Sentence size: " + std::to_string(sentence_features->numSentences()) +
                    ", sen2idx size: " + std::to_string(bank.size()));
    }

    auto readSplit = [&](const std::string& name) {
        Dataset data = readCorpus(options.dataroot + "/" + name, words, tags, intents,
                                  options.lowercase);
        if (sentence_features) attachSentenceIds(data, bank);
        return data;
    };

    JointTrainer trainer(options, logger, words, tags, intents, sentence_features);

    if (options.testing) {
        trainer.setData(Dataset(), Dataset(), readSplit("test"));
        trainer.loadModel(options.read_model);
        trainer.test(exp_path);
    } else {
        trainer.setData(readSplit("train"), readSplit("valid"), readSplit("test"));
        trainer.train(exp_path);
    }
}
