#include "slu/loss.h"
#include "slu/activation.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

// ==================== Weighted NLL Loss ====================

double WeightedNLLLoss::weightOf(size_t cls) const {
    if (class_weights.empty()) return 1.0;
    if (cls >= class_weights.size()) {
        throw std::out_of_range("No weight for class " + std::to_string(cls));
    }
    return class_weights[cls];
}

double WeightedNLLLoss::calculate(const Matrix& predictions, const Matrix& targets) const {
    if (!predictions.sameShape(targets)) {
        throw std::invalid_argument("Predictions and targets must have same shape");
    }

    Matrix log_probs = logSoftmaxRows(predictions);
    double sum = 0.0;
    for (size_t i = 0; i < predictions.getRows(); ++i) {
        for (size_t j = 0; j < predictions.getCols(); ++j) {
            double target = targets.get(i, j);
            if (target == 0.0) continue;
            sum -= weightOf(j) * target * log_probs.get(i, j);
        }
    }
    return sum;
}

Matrix WeightedNLLLoss::gradient(const Matrix& predictions, const Matrix& targets) const {
    if (!predictions.sameShape(targets)) {
        throw std::invalid_argument("Predictions and targets must have same shape");
    }

    // ∂/∂z_k = (Σ_j w_j y_j) · p_k - w_k y_k
    Matrix probs = softmaxRows(predictions);
    Matrix result(predictions.getRows(), predictions.getCols());
    for (size_t i = 0; i < predictions.getRows(); ++i) {
        double row_weight = 0.0;
        for (size_t j = 0; j < predictions.getCols(); ++j) {
            row_weight += weightOf(j) * targets.get(i, j);
        }
        for (size_t k = 0; k < predictions.getCols(); ++k) {
            result.set(i, k, row_weight * probs.get(i, k) - weightOf(k) * targets.get(i, k));
        }
    }
    return result;
}

// ==================== BCE With Logits Loss ====================

double BCEWithLogitsLoss::calculate(const Matrix& predictions, const Matrix& targets) const {
    if (!predictions.sameShape(targets)) {
        throw std::invalid_argument("Predictions and targets must have same shape");
    }

    double sum = 0.0;
    for (size_t i = 0; i < predictions.getRows(); ++i) {
        for (size_t j = 0; j < predictions.getCols(); ++j) {
            double z = predictions.get(i, j);
            double y = targets.get(i, j);
            sum += std::max(z, 0.0) - z * y + std::log1p(std::exp(-std::fabs(z)));
        }
    }
    return sum;
}

Matrix BCEWithLogitsLoss::gradient(const Matrix& predictions, const Matrix& targets) const {
    if (!predictions.sameShape(targets)) {
        throw std::invalid_argument("Predictions and targets must have same shape");
    }

    // Gradient: σ(z) - y
    Matrix result(predictions.getRows(), predictions.getCols());
    for (size_t i = 0; i < predictions.getRows(); ++i) {
        for (size_t j = 0; j < predictions.getCols(); ++j) {
            result.set(i, j, Sigmoid::value(predictions.get(i, j)) - targets.get(i, j));
        }
    }
    return result;
}

// ==================== Helpers ====================

Matrix oneHotRows(const std::vector<int>& ids, size_t num_classes) {
    Matrix result(ids.size(), num_classes);
    for (size_t i = 0; i < ids.size(); ++i) {
        if (ids[i] < 0) continue;
        if (static_cast<size_t>(ids[i]) >= num_classes) {
            throw std::out_of_range("Class id " + std::to_string(ids[i]) + " out of range");
        }
        result.set(i, static_cast<size_t>(ids[i]), 1.0);
    }
    return result;
}
