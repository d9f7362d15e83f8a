#ifndef SLU_LINEAR_H
#define SLU_LINEAR_H

#include "matrix.h"
#include "parameter.h"
#include <string>

/**
 * @brief Fully connected projection Y = X·Wᵀ + b
 *
 * The layer keeps no activations: a sequence model applies the same
 * projection at every timestep, so the caller hands the forward input back
 * to backward().
 */
class Linear {
private:
    size_t input_size;
    size_t output_size;

    Parameter weights;  // (output_size x input_size)
    Parameter biases;   // (output_size x 1)

public:
    /**
     * @brief Constructor
     * @param input_size Number of input features
     * @param output_size Number of output features
     * @param name Prefix for the parameter names
     */
    Linear(size_t input_size, size_t output_size, const std::string& name);

    /**
     * @brief Uniform initialization in [-scale, scale], biases included
     */
    void initializeWeights(double scale);

    /**
     * @brief Forward pass
     * @param input (batch_size x input_size)
     * @return (batch_size x output_size)
     */
    Matrix forward(const Matrix& input) const;

    /**
     * @brief Backward pass: accumulates dW, db and returns dX
     * @param input The matrix given to forward()
     * @param output_gradient Gradient w.r.t. the forward output
     */
    Matrix backward(const Matrix& input, const Matrix& output_gradient);

    ParameterList parameters() { return {&weights, &biases}; }

    size_t getInputSize() const { return input_size; }
    size_t getOutputSize() const { return output_size; }
};

#endif // SLU_LINEAR_H
