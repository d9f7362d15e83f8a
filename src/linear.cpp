#include "slu/linear.h"
#include <stdexcept>

Linear::Linear(size_t input_size, size_t output_size, const std::string& name)
    : input_size(input_size), output_size(output_size),
      weights(name + ".weight", output_size, input_size),
      biases(name + ".bias", output_size, 1) {
    weights.value.xavierInit(input_size, output_size);
}

void Linear::initializeWeights(double scale) {
    weights.value.randomize(-scale, scale);
    biases.value.randomize(-scale, scale);
}

Matrix Linear::forward(const Matrix& input) const {
    if (input.getCols() != input_size) {
        throw std::invalid_argument("Input size mismatch in Linear::forward");
    }

    // Z = X * W^T + b, bias broadcast across the batch
    Matrix z = input * weights.value.transpose();
    for (size_t i = 0; i < z.getRows(); ++i) {
        for (size_t j = 0; j < output_size; ++j) {
            z[i][j] += biases.value[j][0];
        }
    }
    return z;
}

Matrix Linear::backward(const Matrix& input, const Matrix& output_gradient) {
    if (output_gradient.getCols() != output_size || output_gradient.getRows() != input.getRows()) {
        throw std::invalid_argument("Gradient shape mismatch in Linear::backward");
    }

    // dL/dW = delta^T * input
    weights.grad += output_gradient.transpose() * input;

    // dL/db = sum over the batch
    for (size_t j = 0; j < output_size; ++j) {
        double sum = 0.0;
        for (size_t i = 0; i < output_gradient.getRows(); ++i) {
            sum += output_gradient[i][j];
        }
        biases.grad[j][0] += sum;
    }

    // dL/dX = delta * W
    return output_gradient * weights.value;
}
