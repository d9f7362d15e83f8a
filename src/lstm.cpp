#include "slu/lstm.h"
#include <stdexcept>

// ═══════════════════════════════════════════════════════════════════════════
// LSTMCell Implementation
// ═══════════════════════════════════════════════════════════════════════════

LSTMCell::LSTMCell(size_t input_size, size_t hidden_size, const std::string& name)
    : input_size(input_size), hidden_size(hidden_size),
      W_f(name + ".W_f", hidden_size, input_size), W_i(name + ".W_i", hidden_size, input_size),
      W_c(name + ".W_c", hidden_size, input_size), W_o(name + ".W_o", hidden_size, input_size),
      U_f(name + ".U_f", hidden_size, hidden_size), U_i(name + ".U_i", hidden_size, hidden_size),
      U_c(name + ".U_c", hidden_size, hidden_size), U_o(name + ".U_o", hidden_size, hidden_size),
      b_f(name + ".b_f", hidden_size, 1), b_i(name + ".b_i", hidden_size, 1),
      b_c(name + ".b_c", hidden_size, 1), b_o(name + ".b_o", hidden_size, 1) {

    // Xavier for the weights, forget gate bias at 1.0 so the cell remembers
    // by default early in training
    for (Parameter* W : {&W_f, &W_i, &W_c, &W_o}) {
        W->value.xavierInit(input_size, hidden_size);
    }
    for (Parameter* U : {&U_f, &U_i, &U_c, &U_o}) {
        U->value.xavierInit(hidden_size, hidden_size);
    }
    b_f.value.fill(1.0);
}

void LSTMCell::initializeWeights(double scale) {
    for (Parameter* p : parameters()) {
        p->value.randomize(-scale, scale);
    }
}

ParameterList LSTMCell::parameters() {
    return {&W_f, &W_i, &W_c, &W_o,
            &U_f, &U_i, &U_c, &U_o,
            &b_f, &b_i, &b_c, &b_o};
}

Matrix LSTMCell::gate(const Matrix& input, const Matrix& prev_hidden,
                      const Parameter& W, const Parameter& U, const Parameter& b) const {
    Matrix pre = input * W.value.transpose() + prev_hidden * U.value.transpose();
    for (size_t i = 0; i < pre.getRows(); ++i) {
        for (size_t j = 0; j < hidden_size; ++j) {
            pre[i][j] += b.value[j][0];
        }
    }
    return pre;
}

std::pair<Matrix, Matrix> LSTMCell::forward(const Matrix& input,
                                            const Matrix& prev_hidden,
                                            const Matrix& prev_cell,
                                            LSTMStepCache& cache) const {
    if (input.getCols() != input_size) {
        throw std::invalid_argument("Input size mismatch in LSTMCell::forward");
    }

    cache.input = input;
    cache.prev_hidden = prev_hidden;
    cache.prev_cell = prev_cell;

    cache.forget_gate = sigmoid.forward(gate(input, prev_hidden, W_f, U_f, b_f));
    cache.input_gate = sigmoid.forward(gate(input, prev_hidden, W_i, U_i, b_i));
    cache.candidate = tanh_activation.forward(gate(input, prev_hidden, W_c, U_c, b_c));
    cache.output_gate = sigmoid.forward(gate(input, prev_hidden, W_o, U_o, b_o));

    // C(t) = f(t) ⊙ C(t-1) + i(t) ⊙ C̃(t)
    cache.cell = cache.forget_gate.hadamard(prev_cell) +
                 cache.input_gate.hadamard(cache.candidate);

    // h(t) = o(t) ⊙ tanh(C(t))
    cache.cell_tanh = tanh_activation.forward(cache.cell);
    Matrix hidden = cache.output_gate.hadamard(cache.cell_tanh);

    return {hidden, cache.cell};
}

std::tuple<Matrix, Matrix, Matrix> LSTMCell::backward(const Matrix& grad_hidden,
                                                      const Matrix& grad_cell,
                                                      const LSTMStepCache& cache) {
    // Output gate
    Matrix grad_o = grad_hidden.hadamard(cache.cell_tanh);
    Matrix grad_o_pre = sigmoid.backward(cache.output_gate, grad_o);

    // Cell: from h(t) through tanh, plus the carried cell gradient
    Matrix grad_c = tanh_activation.backward(cache.cell_tanh,
                                             grad_hidden.hadamard(cache.output_gate)) + grad_cell;

    // Input gate and candidate
    Matrix grad_i_pre = sigmoid.backward(cache.input_gate, grad_c.hadamard(cache.candidate));
    Matrix grad_candidate_pre = tanh_activation.backward(cache.candidate,
                                                         grad_c.hadamard(cache.input_gate));

    // Forget gate
    Matrix grad_f_pre = sigmoid.backward(cache.forget_gate, grad_c.hadamard(cache.prev_cell));

    Matrix grad_prev_cell = grad_c.hadamard(cache.forget_gate);

    const Matrix* gate_grads[4] = {&grad_f_pre, &grad_i_pre, &grad_candidate_pre, &grad_o_pre};
    Parameter* Ws[4] = {&W_f, &W_i, &W_c, &W_o};
    Parameter* Us[4] = {&U_f, &U_i, &U_c, &U_o};
    Parameter* bs[4] = {&b_f, &b_i, &b_c, &b_o};

    Matrix grad_input(cache.input.getRows(), input_size);
    Matrix grad_prev_hidden(cache.prev_hidden.getRows(), hidden_size);

    for (int k = 0; k < 4; ++k) {
        const Matrix& delta = *gate_grads[k];
        Matrix delta_t = delta.transpose();

        Ws[k]->grad += delta_t * cache.input;
        Us[k]->grad += delta_t * cache.prev_hidden;
        Matrix bias_grad = delta.sumCols();
        for (size_t j = 0; j < hidden_size; ++j) {
            bs[k]->grad[j][0] += bias_grad[0][j];
        }

        grad_input += delta * Ws[k]->value;
        grad_prev_hidden += delta * Us[k]->value;
    }

    return {grad_input, grad_prev_hidden, grad_prev_cell};
}

// ═══════════════════════════════════════════════════════════════════════════
// LSTMLayer Implementation
// ═══════════════════════════════════════════════════════════════════════════

LSTMLayer::LSTMLayer(size_t input_size, size_t hidden_size, bool reverse, const std::string& name)
    : input_size(input_size), hidden_size(hidden_size), reverse(reverse),
      cell(input_size, hidden_size, name) {}

std::vector<Matrix> LSTMLayer::forward(const std::vector<Matrix>& sequence,
                                       const std::vector<size_t>& lengths) {
    size_t seq_length = sequence.size();
    caches.assign(seq_length, LSTMStepCache());
    std::vector<Matrix> outputs(seq_length);
    if (seq_length == 0) {
        return outputs;
    }

    size_t batch_size = sequence[0].getRows();
    if (lengths.size() != batch_size) {
        throw std::invalid_argument("One length per batch row is required");
    }

    Matrix h(batch_size, hidden_size);
    Matrix c(batch_size, hidden_size);

    for (size_t step = 0; step < seq_length; ++step) {
        size_t t = reverse ? seq_length - 1 - step : step;
        LSTMStepCache& cache = caches[t];

        auto [new_h, new_c] = cell.forward(sequence[t], h, c, cache);

        cache.mask.assign(batch_size, 0.0);
        Matrix output(batch_size, hidden_size);
        for (size_t b = 0; b < batch_size; ++b) {
            if (t < lengths[b]) {
                cache.mask[b] = 1.0;
                h[b] = new_h[b];
                c[b] = new_c[b];
                output[b] = new_h[b];
            }
        }
        outputs[t] = output;
    }

    return outputs;
}

std::vector<Matrix> LSTMLayer::backward(const std::vector<Matrix>& grad_output) {
    size_t seq_length = caches.size();
    if (grad_output.size() != seq_length) {
        throw std::invalid_argument("Gradient length mismatch in LSTMLayer::backward");
    }

    std::vector<Matrix> grad_inputs(seq_length);
    if (seq_length == 0) {
        return grad_inputs;
    }

    size_t batch_size = caches[0].mask.size();
    Matrix grad_h_next(batch_size, hidden_size);
    Matrix grad_c_next(batch_size, hidden_size);

    // Reverse of the processing order used by forward()
    for (size_t step = 0; step < seq_length; ++step) {
        size_t t = reverse ? step : seq_length - 1 - step;
        const LSTMStepCache& cache = caches[t];

        Matrix grad_h(batch_size, hidden_size);
        Matrix grad_c(batch_size, hidden_size);
        for (size_t b = 0; b < batch_size; ++b) {
            if (cache.mask[b] == 0.0) continue;
            for (size_t j = 0; j < hidden_size; ++j) {
                grad_h[b][j] = grad_output[t][b][j] + grad_h_next[b][j];
                grad_c[b][j] = grad_c_next[b][j];
            }
        }

        auto [grad_input, grad_prev_h, grad_prev_c] = cell.backward(grad_h, grad_c, cache);

        // Frozen rows pass their carried gradient straight through
        for (size_t b = 0; b < batch_size; ++b) {
            if (cache.mask[b] != 0.0) continue;
            grad_prev_h[b] = grad_h_next[b];
            grad_prev_c[b] = grad_c_next[b];
        }

        grad_inputs[t] = grad_input;
        grad_h_next = grad_prev_h;
        grad_c_next = grad_prev_c;
    }

    return grad_inputs;
}
