#ifndef SLU_PARAMETER_H
#define SLU_PARAMETER_H

#include "matrix.h"
#include <string>
#include <vector>

/**
 * @brief Trainable matrix with its accumulated gradient
 *
 * The name doubles as the optimizer state key and as the checkpoint record
 * name, so it must be unique within a model.
 */
struct Parameter {
    std::string name;
    Matrix value;
    Matrix grad;

    Parameter() = default;
    Parameter(const std::string& name, size_t rows, size_t cols)
        : name(name), value(rows, cols), grad(rows, cols) {}

    void zeroGrad() { grad.zeros(); }
};

using ParameterList = std::vector<Parameter*>;

#endif // SLU_PARAMETER_H
