#include <gtest/gtest.h>
#include "slu/activation.h"
#include "slu/matrix.h"
#include "slu/random.h"

namespace {

Matrix from(const std::vector<std::vector<double>>& rows) {
    return Matrix(rows);
}

}  // namespace

TEST(Matrix, MultiplicationAndTranspose) {
    Matrix a = from({{1, 2, 3}, {4, 5, 6}});
    Matrix b = from({{1, 0}, {0, 1}, {1, 1}});

    Matrix c = a * b;
    ASSERT_EQ(c.getRows(), 2u);
    ASSERT_EQ(c.getCols(), 2u);
    EXPECT_EQ(c.get(0, 0), 4.0);
    EXPECT_EQ(c.get(0, 1), 5.0);
    EXPECT_EQ(c.get(1, 0), 10.0);
    EXPECT_EQ(c.get(1, 1), 11.0);

    Matrix t = a.transpose();
    EXPECT_EQ(t.getRows(), 3u);
    EXPECT_EQ(t.get(2, 1), 6.0);

    EXPECT_THROW(a * a, std::invalid_argument);
}

TEST(Matrix, ElementWiseOperations) {
    Matrix a = from({{2, 4}, {6, 8}});
    Matrix b = from({{1, 2}, {3, 4}});

    EXPECT_EQ((a + b).get(1, 1), 12.0);
    EXPECT_EQ((a - b).get(0, 1), 2.0);
    EXPECT_EQ(a.hadamard(b).get(1, 0), 18.0);
    EXPECT_EQ((a / 2.0).get(0, 0), 1.0);
    EXPECT_EQ((0.5 * a).get(1, 1), 4.0);

    a += b;
    a *= 2.0;
    EXPECT_EQ(a.get(0, 0), 6.0);
    EXPECT_THROW(a + Matrix(3, 2), std::invalid_argument);
}

TEST(Matrix, ColumnSlicesAndConcatenation) {
    Matrix left = from({{1, 2}, {3, 4}});
    Matrix right = from({{5}, {6}});

    Matrix joined = Matrix::concatCols(left, right);
    ASSERT_EQ(joined.getCols(), 3u);
    EXPECT_EQ(joined.get(1, 2), 6.0);

    Matrix back = joined.sliceCols(0, 2);
    EXPECT_EQ((back - left).squaredNorm(), 0.0);
    EXPECT_THROW(joined.sliceCols(2, 4), std::out_of_range);
    EXPECT_THROW(Matrix::concatCols(left, Matrix(3, 1)), std::invalid_argument);
}

TEST(Matrix, Reductions) {
    Matrix a = from({{1, -2}, {3, 0.5}});
    EXPECT_DOUBLE_EQ(a.sum(), 2.5);
    EXPECT_DOUBLE_EQ(a.squaredNorm(), 1 + 4 + 9 + 0.25);

    Matrix column_sums = a.sumCols();
    EXPECT_EQ(column_sums.getRows(), 1u);
    EXPECT_DOUBLE_EQ(column_sums.get(0, 1), -1.5);

    EXPECT_EQ(a.argmaxRow(0), 0u);
    EXPECT_EQ(a.argmaxRow(1), 0u);
    EXPECT_EQ(from({{1, 1, 0}}).argmaxRow(0), 0u);
}

TEST(Matrix, RaggedRowsThrow) {
    EXPECT_THROW(from({{1, 2}, {3}}), std::invalid_argument);
}

TEST(Matrix, RandomizeIsReproducibleFromTheSeed) {
    Random::seed(42);
    Matrix first(3, 3);
    first.randomize(-1.0, 1.0);

    Random::seed(42);
    Matrix second(3, 3);
    second.randomize(-1.0, 1.0);

    EXPECT_EQ((first - second).squaredNorm(), 0.0);
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            EXPECT_GE(first.get(i, j), -1.0);
            EXPECT_LT(first.get(i, j), 1.0);
        }
    }
}

// ==================== Activations ====================

TEST(Activation, LogSumExpIsStable) {
    EXPECT_NEAR(logSumExp({1000.0, 1000.0}), 1000.0 + std::log(2.0), 1e-9);
    EXPECT_NEAR(logSumExp({-1000.0, 0.0}), 0.0, 1e-12);
    EXPECT_THROW(logSumExp({}), std::invalid_argument);
}

TEST(Activation, SoftmaxRowsSumToOne) {
    Matrix logits = from({{1, 2, 3}, {-50, 0, 50}});
    Matrix probs = softmaxRows(logits);
    Matrix log_probs = logSoftmaxRows(logits);
    for (size_t i = 0; i < 2; ++i) {
        double total = 0.0;
        for (size_t j = 0; j < 3; ++j) {
            total += probs.get(i, j);
            EXPECT_NEAR(std::log(probs.get(i, j) + 1e-300), log_probs.get(i, j), 1e-6);
        }
        EXPECT_NEAR(total, 1.0, 1e-12);
    }
}

TEST(Activation, SigmoidAndTanhBackward) {
    Sigmoid sigmoid;
    Tanh tanh_activation;
    Matrix x = from({{-2.0, 0.0, 3.0}});
    Matrix ones(1, 3, 1.0);

    Matrix s = sigmoid.forward(x);
    EXPECT_DOUBLE_EQ(s.get(0, 1), 0.5);
    EXPECT_NEAR(sigmoid.backward(s, ones).get(0, 1), 0.25, 1e-12);

    Matrix t = tanh_activation.forward(x);
    EXPECT_NEAR(tanh_activation.backward(t, ones).get(0, 2),
                1.0 - std::tanh(3.0) * std::tanh(3.0), 1e-12);
    EXPECT_NEAR(Sigmoid::value(-800.0), 0.0, 1e-300);
}
