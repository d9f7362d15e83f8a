#include <gtest/gtest.h>
#include "slu/random.h"
#include "slu/tagger.h"
#include "test_utils.h"

namespace {

Vocabulary tagVocabulary() {
    Vocabulary tags;
    for (const char* tag : {"O", "B-obj", "I-obj", "B-time"}) tags.add(tag);
    return tags;
}

Example makeExample(const std::vector<int>& word_ids, const std::vector<int>& tag_ids) {
    Example example;
    example.word_ids = word_ids;
    example.tag_ids = tag_ids;
    example.words.assign(word_ids.size(), "w");
    example.tags.assign(word_ids.size(), "O");
    example.intent_id = 0;
    return example;
}

std::unique_ptr<SlotTagger> makeTagger(const Vocabulary& tags, bool use_crf) {
    auto encoder = std::make_unique<SequenceEncoder>(8, 4, 0, 3, 1, true, 0.0);
    auto tagger = std::make_unique<SlotTagger>(std::move(encoder), tags, use_crf);
    tagger->initializeWeights(0.3);
    return tagger;
}

class SlotTaggerTest : public ::testing::TestWithParam<bool> {
protected:
    Vocabulary tags = tagVocabulary();
    Dataset data;

    void SetUp() override {
        Random::seed(31);
        data.examples = {makeExample({2, 3, 4, 5}, {2, 3, 4, 2}),
                         makeExample({6, 7}, {3, 2}),
                         makeExample({5}, {5})};
    }

    Batch batchOf(const std::vector<size_t>& index) const {
        return makeBatch(data, index, 0, index.size(), 0, tags.getPadId());
    }
};

}  // namespace

TEST_P(SlotTaggerTest, MaskedLossEqualsSumOfSingleExampleLosses) {
    auto tagger = makeTagger(tags, GetParam());
    EXPECT_EQ(tagger->usesCRF(), GetParam());
    EXPECT_TRUE(tagger->getEncoder().isBidirectional());

    Batch batch = batchOf({0, 1, 2});
    double batched = tagger->loss(tagger->forward(batch, false), batch);

    double separate = 0.0;
    for (size_t i = 0; i < 3; ++i) {
        Batch single = batchOf({i});
        separate += tagger->loss(tagger->forward(single, false), single);
    }
    EXPECT_NEAR(batched, separate, 1e-9);
}

TEST_P(SlotTaggerTest, DecodeReturnsOnePathPerExampleOfItsLength) {
    auto tagger = makeTagger(tags, GetParam());
    Batch batch = batchOf({0, 1, 2});

    auto paths = tagger->decode(tagger->forward(batch, false), batch);
    ASSERT_EQ(paths.size(), 3u);
    for (size_t b = 0; b < 3; ++b) {
        EXPECT_EQ(paths[b].size(), batch.lengths[b]);
        for (int id : paths[b]) {
            EXPECT_GE(id, 0);
            EXPECT_LT(id, static_cast<int>(tags.size()));
        }
    }
}

TEST_P(SlotTaggerTest, HiddenGradientMatchesFiniteDifferences) {
    auto tagger = makeTagger(tags, GetParam());
    Batch batch = batchOf({0, 1});
    TaggerOutput output = tagger->forward(batch, false);
    std::vector<Matrix> grad = tagger->backward(output, batch, 0.7);

    Parameter* weight = nullptr;
    Parameter* bias = nullptr;
    for (Parameter* p : tagger->parameters()) {
        if (p->name == "tagger.hidden2tag.weight") weight = p;
        if (p->name == "tagger.hidden2tag.bias") bias = p;
    }
    ASSERT_NE(weight, nullptr);
    ASSERT_NE(bias, nullptr);

    // Emissions of one timestep recomputed from perturbed hidden states
    auto project = [&](const Matrix& hidden) {
        Matrix emissions = hidden * weight->value.transpose();
        for (size_t r = 0; r < emissions.getRows(); ++r) {
            for (size_t k = 0; k < emissions.getCols(); ++k) {
                emissions[r][k] += bias->value[k][0];
            }
        }
        return emissions;
    };

    const double h = 1e-6;
    for (size_t t = 0; t < output.encoded.maxLength(); ++t) {
        for (size_t b = 0; b < batch.size(); ++b) {
            if (t >= batch.lengths[b]) continue;
            for (size_t j = 0; j < output.encoded.hiddenDim(); ++j) {
                TaggerOutput plus = output;
                TaggerOutput minus = output;
                plus.encoded.hidden[t][b][j] += h;
                minus.encoded.hidden[t][b][j] -= h;
                plus.emissions[t] = project(plus.encoded.hidden[t]);
                minus.emissions[t] = project(minus.encoded.hidden[t]);

                double numeric = 0.7 * (tagger->loss(plus, batch) - tagger->loss(minus, batch)) /
                                 (2 * h);
                EXPECT_NEAR(grad[t].get(b, j), numeric, 1e-5) << "t=" << t << " b=" << b;
            }
        }
    }
}

TEST_P(SlotTaggerTest, TrainingStepsReduceTheLoss) {
    auto tagger = makeTagger(tags, GetParam());
    Batch batch = batchOf({0, 1, 2});
    ParameterList params = tagger->parameters();

    double initial = tagger->loss(tagger->forward(batch, false), batch);
    for (int step = 0; step < 30; ++step) {
        for (Parameter* p : params) p->zeroGrad();
        TaggerOutput output = tagger->forward(batch, true);
        tagger->backwardEncoder(tagger->backward(output, batch, 1.0));
        for (Parameter* p : params) p->value -= p->grad * 0.05;
    }
    double final_loss = tagger->loss(tagger->forward(batch, false), batch);
    EXPECT_LT(final_loss, initial);
}

INSTANTIATE_TEST_SUITE_P(SoftmaxAndCRF, SlotTaggerTest, ::testing::Values(false, true));

TEST(SlotTagger, MissingPadTagThrows) {
    Vocabulary tags(false, true);
    tags.add("O");
    tags.add("B-obj");
    auto encoder = std::make_unique<SequenceEncoder>(5, 3, 0, 2, 1, false, 0.0);
    EXPECT_THROW(SlotTagger(std::move(encoder), tags, true), std::invalid_argument);
}

TEST(SlotTagger, CRFParametersOnlyWithCRF) {
    Vocabulary tags = tagVocabulary();
    EXPECT_EQ(makeTagger(tags, false)->getCRF(), nullptr);
    auto tagger = makeTagger(tags, true);
    ASSERT_NE(tagger->getCRF(), nullptr);
    EXPECT_EQ(tagger->getCRF()->getNumTags(), tags.size());
    EXPECT_EQ(tagger->parameters().back()->name, "crf.transitions");
}
