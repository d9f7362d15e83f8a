#include <gtest/gtest.h>
#include "slu/intent_classifier.h"
#include "slu/random.h"
#include "test_utils.h"

namespace {

const size_t kHiddenSize = 3;
const size_t kClasses = 4;

// Encoder output of two rows, lengths 4 and 2, zero on padding
EncoderOutput makeEncoded(bool bidirectional) {
    EncoderOutput encoded;
    encoded.hidden_size = kHiddenSize;
    encoded.bidirectional = bidirectional;
    encoded.lengths = {4, 2};
    for (size_t t = 0; t < 4; ++t) {
        Matrix step = randomMatrix(2, encoded.hiddenDim());
        if (t >= 2) {
            for (size_t j = 0; j < encoded.hiddenDim(); ++j) step[1][j] = 0.0;
        }
        encoded.hidden.push_back(step);
    }
    return encoded;
}

class IntentHeadTest : public ::testing::TestWithParam<IntentStrategy> {};

}  // namespace

TEST_P(IntentHeadTest, HiddenGradientMatchesFiniteDifferences) {
    Random::seed(21);
    for (bool bidirectional : {false, true}) {
        auto head = createIntentClassifier(GetParam(), kHiddenSize, bidirectional, kClasses);
        ASSERT_TRUE(head != nullptr);
        head->initializeWeights(0.5);

        EncoderOutput encoded = makeEncoded(bidirectional);
        Matrix weights = randomMatrix(2, kClasses);

        Matrix logits = head->forward(encoded);
        ASSERT_EQ(logits.getRows(), 2u);
        ASSERT_EQ(logits.getCols(), kClasses);
        std::vector<Matrix> grad = head->backward(weights);
        ASSERT_EQ(grad.size(), 4u);

        const double h = 1e-6;
        for (size_t b = 0; b < 2; ++b) {
            for (size_t t = 0; t < encoded.lengths[b]; ++t) {
                for (size_t j = 0; j < encoded.hiddenDim(); ++j) {
                    EncoderOutput plus = encoded;
                    EncoderOutput minus = encoded;
                    plus.hidden[t][b][j] += h;
                    minus.hidden[t][b][j] -= h;
                    double numeric = (head->forward(plus).hadamard(weights).sum() -
                                      head->forward(minus).hadamard(weights).sum()) / (2 * h);
                    EXPECT_NEAR(grad[t].get(b, j), numeric, 1e-5)
                        << head->getName() << (bidirectional ? " bi" : " uni")
                        << " b=" << b << " t=" << t << " j=" << j;
                }
            }
        }
    }
}

TEST_P(IntentHeadTest, WeightGradientMatchesFiniteDifferences) {
    Random::seed(22);
    auto head = createIntentClassifier(GetParam(), kHiddenSize, true, kClasses);
    head->initializeWeights(0.5);

    EncoderOutput encoded = makeEncoded(true);
    Matrix weights = randomMatrix(2, kClasses);

    ParameterList params = head->parameters();
    for (Parameter* p : params) p->zeroGrad();
    head->forward(encoded);
    head->backward(weights);

    const double h = 1e-6;
    for (Parameter* p : params) {
        double original = p->value.get(0, 0);
        p->value.set(0, 0, original + h);
        double plus = head->forward(encoded).hadamard(weights).sum();
        p->value.set(0, 0, original - h);
        double minus = head->forward(encoded).hadamard(weights).sum();
        p->value.set(0, 0, original);

        EXPECT_NEAR(p->grad.get(0, 0), (plus - minus) / (2 * h), 1e-5) << p->name;
    }
}

TEST_P(IntentHeadTest, OutputLayerIsShared) {
    auto head = createIntentClassifier(GetParam(), kHiddenSize, false, kClasses);
    ParameterList params = head->parameters();
    ASSERT_GE(params.size(), 2u);
    EXPECT_EQ(params[params.size() - 2]->name, "intent.hidden2class.weight");
    EXPECT_EQ(params.back()->name, "intent.hidden2class.bias");
    EXPECT_EQ(head->getNumClasses(), kClasses);
    EXPECT_EQ(head->getName(), intentStrategyName(GetParam()));
}

INSTANTIATE_TEST_SUITE_P(AllStrategies, IntentHeadTest,
                         ::testing::Values(IntentStrategy::TwoTails,
                                           IntentStrategy::MaxPooling,
                                           IntentStrategy::HiddenCNN,
                                           IntentStrategy::HiddenAttention));

// ==================== Pooling details ====================

TEST(TwoTailsClassifier, ReadsLastForwardAndFirstBackwardState) {
    TwoTailsClassifier head(2, true, 1);
    Parameter* weight = head.parameters()[0];
    Parameter* bias = head.parameters()[1];
    weight->value = Matrix(std::vector<std::vector<double>>{{1.0, 10.0, 100.0, 1000.0}});
    bias->value.zeros();

    EncoderOutput encoded;
    encoded.hidden_size = 2;
    encoded.bidirectional = true;
    encoded.lengths = {2};
    encoded.hidden = {Matrix(std::vector<std::vector<double>>{{9.0, 9.0, 3.0, 4.0}}),
                      Matrix(std::vector<std::vector<double>>{{1.0, 2.0, 9.0, 9.0}})};

    Matrix logits = head.forward(encoded);
    EXPECT_NEAR(logits.get(0, 0), 1.0 + 20.0 + 300.0 + 4000.0, 1e-9);
}

TEST(MaxPoolingClassifier, IgnoresPaddedPositions) {
    MaxPoolingClassifier head(1, 1);
    head.parameters()[0]->value = Matrix(1, 1, 1.0);
    head.parameters()[1]->value.zeros();

    EncoderOutput encoded;
    encoded.hidden_size = 1;
    encoded.lengths = {2};
    encoded.hidden = {Matrix(1, 1, -3.0), Matrix(1, 1, -1.0), Matrix(1, 1, 0.0)};

    EXPECT_NEAR(head.forward(encoded).get(0, 0), -1.0, 1e-12);
}

TEST(HiddenAttentionClassifier, WeightsAreADistributionOverValidTokens) {
    Random::seed(23);
    HiddenAttentionClassifier head(2 * kHiddenSize, 5, kClasses);
    head.initializeWeights(0.5);
    head.forward(makeEncoded(true));

    const Matrix& weights = head.getAttentionWeights();
    EXPECT_NEAR(rowOf(weights, 0).sum(), 1.0, 1e-12);
    EXPECT_NEAR(rowOf(weights, 1).sum(), 1.0, 1e-12);
    EXPECT_EQ(weights.get(1, 2), 0.0);
    EXPECT_EQ(weights.get(1, 3), 0.0);
}

TEST(IntentClassifier, ShapeMismatchThrows) {
    MaxPoolingClassifier head(5, 2);
    EXPECT_THROW(head.forward(makeEncoded(false)), std::invalid_argument);
}

// ==================== Factory and prediction ====================

TEST(IntentStrategyNames, ParseAndName) {
    EXPECT_EQ(parseIntentStrategy("2tails"), IntentStrategy::TwoTails);
    EXPECT_EQ(parseIntentStrategy("hiddenAttention"), IntentStrategy::HiddenAttention);
    EXPECT_EQ(intentStrategyName(IntentStrategy::HiddenCNN), "hiddenCNN");
    EXPECT_THROW(parseIntentStrategy("meanPooling"), std::invalid_argument);
    EXPECT_TRUE(createIntentClassifier(IntentStrategy::None, 3, true, 2) == nullptr);
}

TEST(PredictIntents, ArgmaxForSingleLabel) {
    Matrix logits(std::vector<std::vector<double>>{{0.1, 2.0, -1.0}, {-5.0, -6.0, -7.0}});
    auto predicted = predictIntents(logits, false);
    EXPECT_EQ(predicted[0], std::vector<int>{1});
    EXPECT_EQ(predicted[1], std::vector<int>{0});
}

TEST(PredictIntents, ThresholdForMultiLabel) {
    Matrix logits(std::vector<std::vector<double>>{{0.1, 2.0, -1.0}, {-5.0, 0.0, -7.0}});
    auto predicted = predictIntents(logits, true);
    EXPECT_EQ(predicted[0], (std::vector<int>{0, 1}));
    EXPECT_TRUE(predicted[1].empty());
}
