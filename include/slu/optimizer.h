#ifndef SLU_OPTIMIZER_H
#define SLU_OPTIMIZER_H

#include "matrix.h"
#include "parameter.h"
#include <memory>
#include <string>
#include <unordered_map>

/**
 * @brief Gradient-based update rule applied in place to named parameters
 *
 * Stateful rules keep their moving averages per Parameter::name, so the same
 * optimizer instance must see the same parameter set at every step.
 */
class Optimizer {
protected:
    double learning_rate;

    /**
     * @brief Update one parameter from its accumulated gradient
     */
    virtual void apply(Parameter& param) = 0;

public:
    explicit Optimizer(double learning_rate) : learning_rate(learning_rate) {}
    virtual ~Optimizer() = default;

    void step(const ParameterList& params);

    virtual std::string getName() const = 0;

    double getLearningRate() const { return learning_rate; }
};

/**
 * @brief Plain stochastic gradient descent
 * θ ← θ - α·g
 */
class SGD : public Optimizer {
protected:
    void apply(Parameter& param) override;

public:
    explicit SGD(double learning_rate) : Optimizer(learning_rate) {}
    std::string getName() const override { return "SGD"; }
};

/**
 * @brief RMSprop
 * v ← β·v + (1 - β)·g²
 * θ ← θ - α·g / (√v + ε)
 */
class RMSprop : public Optimizer {
private:
    double beta;
    double epsilon;
    std::unordered_map<std::string, Matrix> square_avg;

protected:
    void apply(Parameter& param) override;

public:
    explicit RMSprop(double learning_rate, double beta = 0.99, double epsilon = 1e-8)
        : Optimizer(learning_rate), beta(beta), epsilon(epsilon) {}

    std::string getName() const override { return "RMSprop"; }
};

/**
 * @brief Adam with bias-corrected moments
 * m ← β₁·m + (1 - β₁)·g,  v ← β₂·v + (1 - β₂)·g²
 * θ ← θ - α·m̂ / (√v̂ + ε)
 */
class Adam : public Optimizer {
private:
    struct Moments {
        Matrix m;
        Matrix v;
        int t = 0;
    };

    double beta1;
    double beta2;
    double epsilon;
    std::unordered_map<std::string, Moments> moments;

protected:
    void apply(Parameter& param) override;

public:
    explicit Adam(double learning_rate, double beta1 = 0.9, double beta2 = 0.999,
                  double epsilon = 1e-8)
        : Optimizer(learning_rate), beta1(beta1), beta2(beta2), epsilon(epsilon) {}

    std::string getName() const override { return "Adam"; }
};

/**
 * @brief Adadelta
 * E[g²] ← ρ·E[g²] + (1 - ρ)·g²
 * Δ     = √(E[Δ²] + ε) / √(E[g²] + ε) · g
 * E[Δ²] ← ρ·E[Δ²] + (1 - ρ)·Δ²
 * θ     ← θ - α·Δ
 */
class Adadelta : public Optimizer {
private:
    struct Averages {
        Matrix square_grad;
        Matrix square_delta;
    };

    double rho;
    double epsilon;
    std::unordered_map<std::string, Averages> averages;

protected:
    void apply(Parameter& param) override;

public:
    explicit Adadelta(double learning_rate = 1.0, double rho = 0.95, double epsilon = 1e-6)
        : Optimizer(learning_rate), rho(rho), epsilon(epsilon) {}

    std::string getName() const override { return "Adadelta"; }
};

/**
 * @brief Optimizer by name: sgd, adam, adadelta or rmsprop (any case)
 *
 * Adadelta always runs with α = 1.0 and ρ = 0.95.
 * @throws std::invalid_argument for an unknown name
 */
std::unique_ptr<Optimizer> createOptimizer(const std::string& name, double learning_rate);

/**
 * @brief Rescale all gradients so their global 2-norm is at most max_norm
 * @return The norm before clipping
 */
double clipGradNorm(const ParameterList& params, double max_norm);

void zeroGradients(const ParameterList& params);

#endif // SLU_OPTIMIZER_H
