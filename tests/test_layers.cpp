#include <gtest/gtest.h>
#include "slu/batch.h"
#include "slu/embedding.h"
#include "slu/encoder.h"
#include "slu/linear.h"
#include "slu/lstm.h"
#include "slu/random.h"
#include "test_utils.h"

namespace {

// Σ_t Σ_ij weights[t] ⊙ outputs[t]
double weightedSum(const std::vector<Matrix>& outputs, const std::vector<Matrix>& weights) {
    double total = 0.0;
    for (size_t t = 0; t < outputs.size(); ++t) {
        total += outputs[t].hadamard(weights[t]).sum();
    }
    return total;
}

std::vector<Matrix> randomSequence(size_t steps, size_t rows, size_t cols) {
    std::vector<Matrix> sequence;
    for (size_t t = 0; t < steps; ++t) {
        sequence.push_back(randomMatrix(rows, cols));
    }
    return sequence;
}

Example makeExample(const std::vector<int>& word_ids, size_t line_number) {
    Example example;
    example.word_ids = word_ids;
    example.tag_ids.assign(word_ids.size(), 2);
    example.words.assign(word_ids.size(), "w");
    example.tags.assign(word_ids.size(), "O");
    example.intent_id = 0;
    example.line_number = line_number;
    return example;
}

}  // namespace

// ==================== Linear ====================

TEST(Linear, BackwardMatchesFiniteDifferences) {
    Random::seed(11);
    Linear layer(3, 2, "test.linear");
    layer.initializeWeights(0.5);
    Matrix input = randomMatrix(4, 3);
    Matrix weights = randomMatrix(4, 2);

    Matrix grad_input = layer.backward(input, weights);

    const double h = 1e-6;
    for (size_t i = 0; i < 4; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            Matrix plus = input;
            Matrix minus = input;
            plus[i][j] += h;
            minus[i][j] -= h;
            double numeric = (layer.forward(plus).hadamard(weights).sum() -
                              layer.forward(minus).hadamard(weights).sum()) / (2 * h);
            EXPECT_NEAR(grad_input.get(i, j), numeric, 1e-6);
        }
    }

    // db = Σ over rows of the output gradient
    Parameter* bias = layer.parameters()[1];
    EXPECT_NEAR(bias->grad.get(0, 0), rowOf(weights.transpose(), 0).sum(), 1e-12);
}

// ==================== Embedding ====================

TEST(Embedding, PaddingRowIsZeroAndFrozen) {
    Random::seed(12);
    Embedding embedding(5, 3, 0, "test.embedding");
    embedding.initializeWeights(0.5);
    EXPECT_EQ(embedding.getVocabSize(), 5u);
    EXPECT_EQ(embedding.getEmbeddingDim(), 3u);

    Matrix looked_up = embedding.forward({0, 2});
    EXPECT_EQ(rowOf(looked_up, 0).squaredNorm(), 0.0);
    EXPECT_GT(rowOf(looked_up, 1).squaredNorm(), 0.0);

    embedding.backward({0, 2}, Matrix(2, 3, 1.0));
    const Matrix& grad = embedding.parameters()[0]->grad;
    EXPECT_EQ(rowOf(grad, 0).sum(), 0.0);
    EXPECT_EQ(rowOf(grad, 2).sum(), 3.0);
}

TEST(Embedding, UnknownIdThrows) {
    Embedding embedding(5, 3, 0, "test.embedding");
    EXPECT_THROW(embedding.forward({5}), std::out_of_range);
}

// ==================== LSTM ====================

TEST(LSTMLayer, PaddedRowMatchesItsUnpaddedRun) {
    Random::seed(13);
    for (bool reverse : {false, true}) {
        LSTMLayer layer(3, 4, reverse, "test.lstm");
        layer.initializeWeights(0.3);

        std::vector<Matrix> batched = randomSequence(5, 2, 3);
        std::vector<Matrix> outputs = layer.forward(batched, {5, 3});

        std::vector<Matrix> alone;
        for (size_t t = 0; t < 3; ++t) alone.push_back(rowOf(batched[t], 1));
        std::vector<Matrix> alone_outputs = layer.forward(alone, {3});

        for (size_t t = 0; t < 3; ++t) {
            for (size_t j = 0; j < 4; ++j) {
                EXPECT_NEAR(outputs[t].get(1, j), alone_outputs[t].get(0, j), 1e-12)
                    << (reverse ? "reverse" : "forward") << " t=" << t;
            }
        }
        for (size_t t = 3; t < 5; ++t) {
            EXPECT_EQ(rowOf(outputs[t], 1).squaredNorm(), 0.0);
        }
    }
}

TEST(LSTMLayer, InputGradientMatchesFiniteDifferences) {
    Random::seed(14);
    for (bool reverse : {false, true}) {
        LSTMLayer layer(2, 3, reverse, "test.lstm");
        layer.initializeWeights(0.5);

        std::vector<size_t> lengths = {4, 2};
        std::vector<Matrix> input = randomSequence(4, 2, 2);
        std::vector<Matrix> weights = randomSequence(4, 2, 3);

        layer.forward(input, lengths);
        std::vector<Matrix> grad_input = layer.backward(weights);

        const double h = 1e-6;
        for (size_t t = 0; t < 4; ++t) {
            for (size_t b = 0; b < 2; ++b) {
                for (size_t j = 0; j < 2; ++j) {
                    std::vector<Matrix> plus = input;
                    std::vector<Matrix> minus = input;
                    plus[t][b][j] += h;
                    minus[t][b][j] -= h;
                    double numeric = (weightedSum(layer.forward(plus, lengths), weights) -
                                      weightedSum(layer.forward(minus, lengths), weights)) /
                                     (2 * h);
                    EXPECT_NEAR(grad_input[t].get(b, j), numeric, 1e-6)
                        << (reverse ? "reverse" : "forward") << " t=" << t << " b=" << b;
                }
            }
        }
    }
}

TEST(LSTMLayer, WeightGradientMatchesFiniteDifferences) {
    Random::seed(15);
    LSTMLayer layer(2, 3, false, "test.lstm");
    layer.initializeWeights(0.5);

    std::vector<size_t> lengths = {3, 1};
    std::vector<Matrix> input = randomSequence(3, 2, 2);
    std::vector<Matrix> weights = randomSequence(3, 2, 3);

    ParameterList params = layer.parameters();
    for (Parameter* p : params) p->zeroGrad();
    layer.forward(input, lengths);
    layer.backward(weights);

    const double h = 1e-6;
    for (Parameter* p : params) {
        double original = p->value.get(0, 0);
        p->value.set(0, 0, original + h);
        double plus = weightedSum(layer.forward(input, lengths), weights);
        p->value.set(0, 0, original - h);
        double minus = weightedSum(layer.forward(input, lengths), weights);
        p->value.set(0, 0, original);

        EXPECT_NEAR(p->grad.get(0, 0), (plus - minus) / (2 * h), 1e-6) << p->name;
    }
}

// ==================== Encoder ====================

TEST(SequenceEncoder, BidirectionalOutputShapeAndPadding) {
    Random::seed(16);
    SequenceEncoder encoder(6, 4, 0, 3, 2, true, 0.0);
    encoder.initializeWeights(0.2);

    Dataset data;
    data.examples = {makeExample({2, 3, 4}, 1), makeExample({5}, 2)};
    Batch batch = makeBatch(data, {0, 1}, 0, 2, 0, 0);

    EncoderOutput out = encoder.forward(batch, false);
    EXPECT_EQ(encoder.getOutputSize(), 6u);
    EXPECT_EQ(out.hiddenDim(), 6u);
    ASSERT_EQ(out.maxLength(), 3u);
    EXPECT_EQ(out.hidden[0].getCols(), 6u);
    EXPECT_EQ(rowOf(out.hidden[1], 1).squaredNorm(), 0.0);
    EXPECT_EQ(rowOf(out.hidden[2], 1).squaredNorm(), 0.0);
    EXPECT_GT(rowOf(out.hidden[0], 1).squaredNorm(), 0.0);
}

TEST(SequenceEncoder, EmbeddingGradientMatchesFiniteDifferences) {
    Random::seed(17);
    SequenceEncoder encoder(5, 3, 0, 2, 1, true, 0.0);
    encoder.initializeWeights(0.5);

    Dataset data;
    data.examples = {makeExample({1, 2, 3}, 1), makeExample({4, 2}, 2)};
    Batch batch = makeBatch(data, {0, 1}, 0, 2, 0, 0);
    std::vector<Matrix> weights = randomSequence(3, 2, 4);

    ParameterList params = encoder.parameters();
    for (Parameter* p : params) p->zeroGrad();
    encoder.forward(batch, false);
    encoder.backward(weights);

    Parameter* table = params.front();
    const double h = 1e-6;
    for (size_t id = 1; id < 5; ++id) {
        double original = table->value.get(id, 1);
        table->value.set(id, 1, original + h);
        double plus = weightedSum(encoder.forward(batch, false).hidden, weights);
        table->value.set(id, 1, original - h);
        double minus = weightedSum(encoder.forward(batch, false).hidden, weights);
        table->value.set(id, 1, original);

        EXPECT_NEAR(table->grad.get(id, 1), (plus - minus) / (2 * h), 1e-6) << "word " << id;
    }
    EXPECT_EQ(rowOf(table->grad, 0).squaredNorm(), 0.0);
}

TEST(SequenceEncoder, DropoutOnlyWhileTraining) {
    Random::seed(18);
    SequenceEncoder encoder(5, 3, 0, 4, 1, false, 0.5);
    encoder.initializeWeights(0.5);

    Dataset data;
    data.examples = {makeExample({1, 2, 3}, 1)};
    Batch batch = makeBatch(data, {0}, 0, 1, 0, 0);

    EncoderOutput first = encoder.forward(batch, false);
    EncoderOutput second = encoder.forward(batch, false);
    for (size_t t = 0; t < 3; ++t) {
        EXPECT_EQ((first.hidden[t] - second.hidden[t]).squaredNorm(), 0.0);
    }

    EncoderOutput trained = encoder.forward(batch, true);
    double difference = 0.0;
    for (size_t t = 0; t < 3; ++t) {
        difference += (trained.hidden[t] - first.hidden[t]).squaredNorm();
    }
    EXPECT_GT(difference, 0.0);
}

TEST(SequenceEncoder, SentenceFeaturesWidenTheInput) {
    Matrix table(std::vector<std::vector<double>>{{0.1, 0.2, 0.3, 0.4}, {1.0, 1.0, 1.0, 1.0}});
    auto features = std::make_shared<const SentenceFeatures>(table, 2, 2);
    SequenceEncoder encoder(5, 3, 0, 2, 1, false, 0.0, features);

    // Embedding (5×3) then the first LSTM gate weights over 3 + 2 inputs
    ParameterList params = encoder.parameters();
    EXPECT_EQ(params[1]->value.getCols(), 5u);

    Dataset data;
    data.examples = {makeExample({1, 2}, 1)};
    Batch batch = makeBatch(data, {0}, 0, 1, 0, 0);
    EXPECT_THROW(encoder.forward(batch, false), std::runtime_error);

    data.examples[0].sentence_id = 1;
    batch = makeBatch(data, {0}, 0, 1, 0, 0);
    EXPECT_NO_THROW(encoder.forward(batch, false));
}
