#ifndef SLU_ACTIVATION_H
#define SLU_ACTIVATION_H

#include "matrix.h"
#include <vector>

/**
 * @brief Base class for element-wise activation functions
 *
 * backward() receives the activated output instead of the pre-activation
 * input: the recurrent and attention layers cache outputs, and the
 * derivatives of sigmoid and tanh are cheapest to express in terms of them.
 */
class Activation {
public:
    virtual ~Activation() = default;

    /**
     * @brief Forward pass through activation function
     * @param input Pre-activation values
     * @return Activated output
     */
    virtual Matrix forward(const Matrix& input) const = 0;

    /**
     * @brief Backward pass
     * @param output Result of forward() for the same input
     * @param output_gradient Gradient w.r.t. the output
     * @return Gradient w.r.t. the input
     */
    virtual Matrix backward(const Matrix& output, const Matrix& output_gradient) const = 0;
};

/**
 * @brief Sigmoid activation function
 * σ(x) = 1 / (1 + e^(-x))
 */
class Sigmoid : public Activation {
public:
    Matrix forward(const Matrix& input) const override;
    Matrix backward(const Matrix& output, const Matrix& output_gradient) const override;

    /**
     * @brief Scalar sigmoid that never overflows exp()
     */
    static double value(double x);
};

/**
 * @brief Hyperbolic tangent activation function
 */
class Tanh : public Activation {
public:
    Matrix forward(const Matrix& input) const override;
    Matrix backward(const Matrix& output, const Matrix& output_gradient) const override;
};

/**
 * @brief log(Σ exp(x_i)) with max subtraction
 * @throws std::invalid_argument on an empty input
 */
double logSumExp(const std::vector<double>& values);

/**
 * @brief Row-wise log-softmax
 */
Matrix logSoftmaxRows(const Matrix& input);

/**
 * @brief Row-wise softmax
 */
Matrix softmaxRows(const Matrix& input);

#endif // SLU_ACTIVATION_H
