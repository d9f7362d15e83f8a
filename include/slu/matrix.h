#ifndef SLU_MATRIX_H
#define SLU_MATRIX_H

#include <vector>
#include <functional>
#include <stdexcept>
#include <cstddef>

/**
 * @brief Dense matrix of doubles used by every layer of the tagger
 *
 * Batched quantities are laid out one example per row: a timestep of a
 * padded batch is a (batch_size × features) matrix, and a sequence is a
 * std::vector of such matrices indexed by time.
 */
class Matrix {
private:
    std::vector<std::vector<double>> data;
    size_t rows;
    size_t cols;

public:
    // Constructors
    Matrix();
    Matrix(size_t rows, size_t cols);
    Matrix(size_t rows, size_t cols, double value);
    Matrix(const std::vector<std::vector<double>>& data);

    // Arithmetic operations
    Matrix operator+(const Matrix& other) const;
    Matrix operator-(const Matrix& other) const;
    Matrix operator*(const Matrix& other) const;  // Matrix multiplication
    Matrix operator*(double scalar) const;
    Matrix operator/(double scalar) const;

    // Compound assignment operators
    Matrix& operator+=(const Matrix& other);
    Matrix& operator-=(const Matrix& other);
    Matrix& operator*=(double scalar);

    // Element-wise operations
    Matrix hadamard(const Matrix& other) const;  // Element-wise multiplication

    Matrix transpose() const;

    /**
     * @brief Columns [begin, end) as a new matrix
     */
    Matrix sliceCols(size_t begin, size_t end) const;

    /**
     * @brief Side-by-side concatenation (row counts must match)
     */
    static Matrix concatCols(const Matrix& left, const Matrix& right);

    // Statistical operations
    double sum() const;
    double squaredNorm() const;
    Matrix sumCols() const;  // Sum along columns (returns row vector)

    /**
     * @brief Index of the largest element of row i (first one on ties)
     */
    size_t argmaxRow(size_t i) const;

    // Apply function to all elements
    Matrix apply(std::function<double(double)> func) const;

    // Initialization methods
    void fill(double value);
    void zeros();
    void randomize(double min, double max);
    void xavierInit(size_t fan_in, size_t fan_out);

    // Getters and setters
    double get(size_t i, size_t j) const;
    void set(size_t i, size_t j, double value);
    size_t getRows() const { return rows; }
    size_t getCols() const { return cols; }
    bool empty() const { return rows == 0 || cols == 0; }

    // Access operators
    std::vector<double>& operator[](size_t i);
    const std::vector<double>& operator[](size_t i) const;

    bool sameShape(const Matrix& other) const;
};

// Scalar * matrix
Matrix operator*(double scalar, const Matrix& matrix);

#endif // SLU_MATRIX_H
