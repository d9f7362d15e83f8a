#ifndef SLU_LOSS_H
#define SLU_LOSS_H

#include "matrix.h"
#include <utility>
#include <vector>

/**
 * @brief Base class for loss functions
 *
 * Losses are summed over the batch, never averaged: callers divide by the
 * token or example count when they report them.
 */
class Loss {
public:
    virtual ~Loss() = default;

    /**
     * @brief Calculate loss value
     * @param predictions Raw scores (logits), one example per row
     * @param targets Same shape as predictions
     * @return Loss value summed over rows
     */
    virtual double calculate(const Matrix& predictions, const Matrix& targets) const = 0;

    /**
     * @brief Calculate gradient of loss with respect to predictions
     * @param predictions Raw scores (logits)
     * @param targets True values
     * @return Gradient matrix
     */
    virtual Matrix gradient(const Matrix& predictions, const Matrix& targets) const = 0;
};

/**
 * @brief Negative log-likelihood of a log-softmax with per-class weights
 * NLL = -Σ_i w[y_i] · log softmax(z_i)[y_i]
 *
 * Targets are one-hot rows. A class of weight 0 (the padding tag) and an
 * all-zero target row contribute nothing.
 */
class WeightedNLLLoss : public Loss {
private:
    std::vector<double> class_weights;  // empty = all ones

    double weightOf(size_t cls) const;

public:
    WeightedNLLLoss() = default;
    explicit WeightedNLLLoss(std::vector<double> class_weights)
        : class_weights(std::move(class_weights)) {}

    double calculate(const Matrix& predictions, const Matrix& targets) const override;
    Matrix gradient(const Matrix& predictions, const Matrix& targets) const override;
};

/**
 * @brief Binary cross-entropy on logits, one independent label per column
 * BCE = Σ max(z, 0) - z·y + log(1 + e^(-|z|))
 */
class BCEWithLogitsLoss : public Loss {
public:
    double calculate(const Matrix& predictions, const Matrix& targets) const override;
    Matrix gradient(const Matrix& predictions, const Matrix& targets) const override;
};

/**
 * @brief One-hot rows; a negative id gives an all-zero row
 * @throws std::out_of_range for an id ≥ num_classes
 */
Matrix oneHotRows(const std::vector<int>& ids, size_t num_classes);

#endif // SLU_LOSS_H
