#include "slu/matrix.h"
#include "slu/random.h"
#include <cmath>
#include <random>

Matrix::Matrix() : rows(0), cols(0) {}

Matrix::Matrix(size_t rows, size_t cols)
    : data(rows, std::vector<double>(cols, 0.0)), rows(rows), cols(cols) {}

Matrix::Matrix(size_t rows, size_t cols, double value)
    : data(rows, std::vector<double>(cols, value)), rows(rows), cols(cols) {}

Matrix::Matrix(const std::vector<std::vector<double>>& data)
    : data(data), rows(data.size()), cols(data.empty() ? 0 : data[0].size()) {
    for (const auto& row : this->data) {
        if (row.size() != cols) {
            throw std::invalid_argument("Matrix rows must all have the same length");
        }
    }
}

// ==================== Arithmetic ====================

Matrix Matrix::operator+(const Matrix& other) const {
    if (rows != other.rows || cols != other.cols) {
        throw std::invalid_argument("Matrix dimensions must match for addition");
    }

    Matrix result(rows, cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[i][j] = data[i][j] + other.data[i][j];
        }
    }
    return result;
}

Matrix Matrix::operator-(const Matrix& other) const {
    if (rows != other.rows || cols != other.cols) {
        throw std::invalid_argument("Matrix dimensions must match for subtraction");
    }

    Matrix result(rows, cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[i][j] = data[i][j] - other.data[i][j];
        }
    }
    return result;
}

Matrix Matrix::operator*(const Matrix& other) const {
    if (cols != other.rows) {
        throw std::invalid_argument("Matrix dimensions incompatible for multiplication");
    }

    Matrix result(rows, other.cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t k = 0; k < cols; ++k) {
            double a = data[i][k];
            if (a == 0.0) continue;
            const std::vector<double>& other_row = other.data[k];
            std::vector<double>& result_row = result.data[i];
            for (size_t j = 0; j < other.cols; ++j) {
                result_row[j] += a * other_row[j];
            }
        }
    }
    return result;
}

Matrix Matrix::operator*(double scalar) const {
    Matrix result(rows, cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[i][j] = data[i][j] * scalar;
        }
    }
    return result;
}

Matrix Matrix::operator/(double scalar) const {
    if (scalar == 0.0) {
        throw std::invalid_argument("Division by zero");
    }
    return (*this) * (1.0 / scalar);
}

Matrix& Matrix::operator+=(const Matrix& other) {
    if (rows != other.rows || cols != other.cols) {
        throw std::invalid_argument("Matrix dimensions must match for addition");
    }
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            data[i][j] += other.data[i][j];
        }
    }
    return *this;
}

Matrix& Matrix::operator-=(const Matrix& other) {
    if (rows != other.rows || cols != other.cols) {
        throw std::invalid_argument("Matrix dimensions must match for subtraction");
    }
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            data[i][j] -= other.data[i][j];
        }
    }
    return *this;
}

Matrix& Matrix::operator*=(double scalar) {
    for (auto& row : data) {
        for (double& value : row) {
            value *= scalar;
        }
    }
    return *this;
}

// ==================== Element-wise ====================

Matrix Matrix::hadamard(const Matrix& other) const {
    if (rows != other.rows || cols != other.cols) {
        throw std::invalid_argument("Matrix dimensions must match for Hadamard product");
    }

    Matrix result(rows, cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[i][j] = data[i][j] * other.data[i][j];
        }
    }
    return result;
}

// ==================== Shape ====================

Matrix Matrix::transpose() const {
    Matrix result(cols, rows);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[j][i] = data[i][j];
        }
    }
    return result;
}

Matrix Matrix::sliceCols(size_t begin, size_t end) const {
    if (begin > end || end > cols) {
        throw std::out_of_range("Column slice out of bounds");
    }

    Matrix result(rows, end - begin);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = begin; j < end; ++j) {
            result.data[i][j - begin] = data[i][j];
        }
    }
    return result;
}

Matrix Matrix::concatCols(const Matrix& left, const Matrix& right) {
    if (left.rows != right.rows) {
        throw std::invalid_argument("Row counts must match for column concatenation");
    }

    Matrix result(left.rows, left.cols + right.cols);
    for (size_t i = 0; i < left.rows; ++i) {
        for (size_t j = 0; j < left.cols; ++j) {
            result.data[i][j] = left.data[i][j];
        }
        for (size_t j = 0; j < right.cols; ++j) {
            result.data[i][left.cols + j] = right.data[i][j];
        }
    }
    return result;
}

// ==================== Reductions ====================

double Matrix::sum() const {
    double total = 0.0;
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            total += data[i][j];
        }
    }
    return total;
}

double Matrix::squaredNorm() const {
    double total = 0.0;
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            total += data[i][j] * data[i][j];
        }
    }
    return total;
}

// Sum along columns (returns row vector)
Matrix Matrix::sumCols() const {
    Matrix result(1, cols);
    for (size_t j = 0; j < cols; ++j) {
        double sum = 0.0;
        for (size_t i = 0; i < rows; ++i) {
            sum += data[i][j];
        }
        result.data[0][j] = sum;
    }
    return result;
}

size_t Matrix::argmaxRow(size_t i) const {
    if (i >= rows || cols == 0) {
        throw std::out_of_range("Matrix row index out of bounds");
    }

    size_t best = 0;
    for (size_t j = 1; j < cols; ++j) {
        if (data[i][j] > data[i][best]) {
            best = j;
        }
    }
    return best;
}

Matrix Matrix::apply(std::function<double(double)> func) const {
    Matrix result(rows, cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[i][j] = func(data[i][j]);
        }
    }
    return result;
}

// ==================== Initialization ====================

void Matrix::fill(double value) {
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            data[i][j] = value;
        }
    }
}

void Matrix::zeros() {
    fill(0.0);
}

// Uniform in [min, max) from the shared generator
void Matrix::randomize(double min, double max) {
    std::uniform_real_distribution<> dis(min, max);
    std::mt19937& gen = Random::generator();

    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            data[i][j] = dis(gen);
        }
    }
}

// Xavier/Glorot initialization
void Matrix::xavierInit(size_t fan_in, size_t fan_out) {
    double limit = std::sqrt(6.0 / (fan_in + fan_out));
    randomize(-limit, limit);
}

// ==================== Access ====================

double Matrix::get(size_t i, size_t j) const {
    if (i >= rows || j >= cols) {
        throw std::out_of_range("Matrix index out of bounds");
    }
    return data[i][j];
}

void Matrix::set(size_t i, size_t j, double value) {
    if (i >= rows || j >= cols) {
        throw std::out_of_range("Matrix index out of bounds");
    }
    data[i][j] = value;
}

std::vector<double>& Matrix::operator[](size_t i) {
    if (i >= rows) {
        throw std::out_of_range("Matrix row index out of bounds");
    }
    return data[i];
}

const std::vector<double>& Matrix::operator[](size_t i) const {
    if (i >= rows) {
        throw std::out_of_range("Matrix row index out of bounds");
    }
    return data[i];
}

bool Matrix::sameShape(const Matrix& other) const {
    return (rows == other.rows && cols == other.cols);
}

Matrix operator*(double scalar, const Matrix& matrix) {
    return matrix * scalar;
}
