#include "slu/activation.h"
#include <cmath>
#include <algorithm>
#include <limits>

// ==================== Sigmoid ====================

double Sigmoid::value(double x) {
    if (x >= 0.0) {
        return 1.0 / (1.0 + std::exp(-x));
    }
    double e = std::exp(x);
    return e / (1.0 + e);
}

Matrix Sigmoid::forward(const Matrix& input) const {
    return input.apply(&Sigmoid::value);
}

Matrix Sigmoid::backward(const Matrix& output, const Matrix& output_gradient) const {
    // σ'(x) = σ(x) * (1 - σ(x))
    Matrix derivative = output.apply([](double s) {
        return s * (1.0 - s);
    });
    return derivative.hadamard(output_gradient);
}

// ==================== Tanh ====================

Matrix Tanh::forward(const Matrix& input) const {
    return input.apply([](double x) {
        return std::tanh(x);
    });
}

Matrix Tanh::backward(const Matrix& output, const Matrix& output_gradient) const {
    // tanh'(x) = 1 - tanh²(x)
    Matrix derivative = output.apply([](double t) {
        return 1.0 - t * t;
    });
    return derivative.hadamard(output_gradient);
}

// ==================== Log-space helpers ====================

double logSumExp(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::invalid_argument("logSumExp of an empty vector");
    }

    double max_value = *std::max_element(values.begin(), values.end());
    if (max_value == -std::numeric_limits<double>::infinity()) {
        return max_value;
    }

    double sum = 0.0;
    for (double v : values) {
        sum += std::exp(v - max_value);
    }
    return max_value + std::log(sum);
}

Matrix logSoftmaxRows(const Matrix& input) {
    Matrix result(input.getRows(), input.getCols());
    for (size_t i = 0; i < input.getRows(); ++i) {
        double norm = logSumExp(input[i]);
        for (size_t j = 0; j < input.getCols(); ++j) {
            result[i][j] = input[i][j] - norm;
        }
    }
    return result;
}

Matrix softmaxRows(const Matrix& input) {
    return logSoftmaxRows(input).apply([](double x) {
        return std::exp(x);
    });
}
