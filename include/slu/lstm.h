#ifndef SLU_LSTM_H
#define SLU_LSTM_H

#include "matrix.h"
#include "activation.h"
#include "parameter.h"
#include <string>
#include <tuple>
#include <utility>
#include <vector>

/**
 * @file lstm.h
 * @brief Masked LSTM over padded batches
 *
 * LSTM Architecture has 3 GATES + 1 CELL STATE:
 *
 *    f(t) = σ(W_f·x(t) + U_f·h(t-1) + b_f)        forget gate
 *    i(t) = σ(W_i·x(t) + U_i·h(t-1) + b_i)        input gate
 *    C̃(t) = tanh(W_c·x(t) + U_c·h(t-1) + b_c)     candidate
 *    o(t) = σ(W_o·x(t) + U_o·h(t-1) + b_o)        output gate
 *    C(t) = f(t) ⊙ C(t-1) + i(t) ⊙ C̃(t)
 *    h(t) = o(t) ⊙ tanh(C(t))
 *
 * Padding: a row whose mask is 0 at step t keeps its previous (h, C) and
 * emits a zero output, so every example behaves as if it had been run
 * alone on its unpadded prefix.
 */

/**
 * @brief Activations of one timestep, kept for BPTT
 */
struct LSTMStepCache {
    Matrix input;
    Matrix prev_hidden;
    Matrix prev_cell;
    Matrix forget_gate;
    Matrix input_gate;
    Matrix candidate;
    Matrix output_gate;
    Matrix cell;
    Matrix cell_tanh;
    std::vector<double> mask;  // 1.0 for valid rows
};

/**
 * @brief LSTM Cell - The building block
 */
class LSTMCell {
private:
    size_t input_size;
    size_t hidden_size;

    // Parameters (4 sets: forget, input, candidate, output)
    Parameter W_f, W_i, W_c, W_o;  // Input weights (hidden × input)
    Parameter U_f, U_i, U_c, U_o;  // Hidden weights (hidden × hidden)
    Parameter b_f, b_i, b_c, b_o;  // Biases (hidden × 1)

    Sigmoid sigmoid;
    Tanh tanh_activation;

    Matrix gate(const Matrix& input, const Matrix& prev_hidden,
                const Parameter& W, const Parameter& U, const Parameter& b) const;

public:
    /**
     * @brief Constructor
     * @param input_size Dimension of input vector
     * @param hidden_size Dimension of hidden state and cell state
     * @param name Prefix for the parameter names
     */
    LSTMCell(size_t input_size, size_t hidden_size, const std::string& name);

    /**
     * @brief Uniform initialization in [-scale, scale]
     */
    void initializeWeights(double scale);

    /**
     * @brief Forward pass for one time step
     * @param input Current input x(t), (batch × input)
     * @param prev_hidden Previous hidden state h(t-1)
     * @param prev_cell Previous cell state C(t-1)
     * @param cache Filled with the activations needed by backward()
     * @return Pair of (new_hidden, new_cell)
     */
    std::pair<Matrix, Matrix> forward(const Matrix& input,
                                      const Matrix& prev_hidden,
                                      const Matrix& prev_cell,
                                      LSTMStepCache& cache) const;

    /**
     * @brief Backward pass for one time step, accumulating weight gradients
     * @return Tuple of (grad_input, grad_prev_hidden, grad_prev_cell)
     */
    std::tuple<Matrix, Matrix, Matrix> backward(const Matrix& grad_hidden,
                                                const Matrix& grad_cell,
                                                const LSTMStepCache& cache);

    ParameterList parameters();

    size_t getInputSize() const { return input_size; }
    size_t getHiddenSize() const { return hidden_size; }
};

/**
 * @brief One direction of an LSTM over a padded batch
 */
class LSTMLayer {
private:
    size_t input_size;
    size_t hidden_size;
    bool reverse;

    LSTMCell cell;

    // Indexed by timestep, not by processing order
    std::vector<LSTMStepCache> caches;

public:
    /**
     * @brief Constructor
     * @param reverse Process the sequence right to left
     */
    LSTMLayer(size_t input_size, size_t hidden_size, bool reverse, const std::string& name);

    void initializeWeights(double scale) { cell.initializeWeights(scale); }

    /**
     * @brief Forward pass through a padded batch
     * @param sequence Per timestep (batch × input_size)
     * @param lengths Valid length of every row, each ≤ sequence.size()
     * @return Per timestep (batch × hidden_size); padded rows are zero
     */
    std::vector<Matrix> forward(const std::vector<Matrix>& sequence,
                                const std::vector<size_t>& lengths);

    /**
     * @brief Backward pass (BPTT) for the last forward()
     * @param grad_output Gradient w.r.t. every output of forward()
     * @return Gradient w.r.t. every input of forward()
     */
    std::vector<Matrix> backward(const std::vector<Matrix>& grad_output);

    ParameterList parameters() { return cell.parameters(); }

    size_t getInputSize() const { return input_size; }
    size_t getHiddenSize() const { return hidden_size; }
};

#endif // SLU_LSTM_H
