#include "slu/optimizer.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

void Optimizer::step(const ParameterList& params) {
    for (Parameter* p : params) {
        if (!p->value.sameShape(p->grad)) {
            throw std::invalid_argument("Gradient shape differs from parameter " + p->name);
        }
        apply(*p);
    }
}

// ==================== SGD ====================

void SGD::apply(Parameter& param) {
    for (size_t i = 0; i < param.value.getRows(); ++i) {
        std::vector<double>& w = param.value[i];
        const std::vector<double>& g = param.grad[i];
        for (size_t j = 0; j < w.size(); ++j) {
            w[j] -= learning_rate * g[j];
        }
    }
}

// ==================== RMSprop ====================

void RMSprop::apply(Parameter& param) {
    auto found = square_avg.find(param.name);
    if (found == square_avg.end()) {
        found = square_avg.emplace(param.name,
                                   Matrix(param.value.getRows(), param.value.getCols())).first;
    }
    Matrix& v = found->second;

    for (size_t i = 0; i < param.value.getRows(); ++i) {
        for (size_t j = 0; j < param.value.getCols(); ++j) {
            double g = param.grad[i][j];
            v[i][j] = beta * v[i][j] + (1.0 - beta) * g * g;
            param.value[i][j] -= learning_rate * g / (std::sqrt(v[i][j]) + epsilon);
        }
    }
}

// ==================== Adam ====================

void Adam::apply(Parameter& param) {
    auto found = moments.find(param.name);
    if (found == moments.end()) {
        Moments fresh;
        fresh.m = Matrix(param.value.getRows(), param.value.getCols());
        fresh.v = Matrix(param.value.getRows(), param.value.getCols());
        found = moments.emplace(param.name, std::move(fresh)).first;
    }
    Moments& state = found->second;
    state.t++;

    // Bias corrections
    double c1 = 1.0 - std::pow(beta1, state.t);
    double c2 = 1.0 - std::pow(beta2, state.t);

    for (size_t i = 0; i < param.value.getRows(); ++i) {
        for (size_t j = 0; j < param.value.getCols(); ++j) {
            double g = param.grad[i][j];
            state.m[i][j] = beta1 * state.m[i][j] + (1.0 - beta1) * g;
            state.v[i][j] = beta2 * state.v[i][j] + (1.0 - beta2) * g * g;

            double m_hat = state.m[i][j] / c1;
            double v_hat = state.v[i][j] / c2;
            param.value[i][j] -= learning_rate * m_hat / (std::sqrt(v_hat) + epsilon);
        }
    }
}

// ==================== Adadelta ====================

void Adadelta::apply(Parameter& param) {
    auto found = averages.find(param.name);
    if (found == averages.end()) {
        Averages fresh;
        fresh.square_grad = Matrix(param.value.getRows(), param.value.getCols());
        fresh.square_delta = Matrix(param.value.getRows(), param.value.getCols());
        found = averages.emplace(param.name, std::move(fresh)).first;
    }
    Averages& state = found->second;

    for (size_t i = 0; i < param.value.getRows(); ++i) {
        for (size_t j = 0; j < param.value.getCols(); ++j) {
            double g = param.grad[i][j];
            double& sq = state.square_grad[i][j];
            double& acc = state.square_delta[i][j];

            sq = rho * sq + (1.0 - rho) * g * g;
            double delta = std::sqrt(acc + epsilon) / std::sqrt(sq + epsilon) * g;
            acc = rho * acc + (1.0 - rho) * delta * delta;
            param.value[i][j] -= learning_rate * delta;
        }
    }
}

// ==================== Helpers ====================

std::unique_ptr<Optimizer> createOptimizer(const std::string& name, double learning_rate) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "sgd") return std::make_unique<SGD>(learning_rate);
    if (key == "adam") return std::make_unique<Adam>(learning_rate);
    if (key == "adadelta") return std::make_unique<Adadelta>(1.0, 0.95);
    if (key == "rmsprop") return std::make_unique<RMSprop>(learning_rate);
    throw std::invalid_argument("Unknown optimizer: " + name);
}

double clipGradNorm(const ParameterList& params, double max_norm) {
    double squared = 0.0;
    for (const Parameter* p : params) {
        squared += p->grad.squaredNorm();
    }
    double norm = std::sqrt(squared);

    double coefficient = max_norm / (norm + 1e-6);
    if (coefficient < 1.0) {
        for (Parameter* p : params) {
            p->grad *= coefficient;
        }
    }
    return norm;
}

void zeroGradients(const ParameterList& params) {
    for (Parameter* p : params) {
        p->zeroGrad();
    }
}
