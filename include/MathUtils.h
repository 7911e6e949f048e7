#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

class MathUtils {
public:
    struct Matrix {
        std::vector<std::vector<double>> data;
        size_t rows;
        size_t cols;

        Matrix(size_t r, size_t c) : data(r, std::vector<double>(c, 0.0)), rows(r), cols(c) {}

        double& at(size_t r, size_t c) { return data[r][c]; }
        double at(size_t r, size_t c) const { return data[r][c]; }

        /**
         * @brief Lower-triangular Cholesky factor L with L*L^T = this.
         * @pre rows == cols and matrix is symmetric.
         * @post Returns std::nullopt when the matrix is not positive definite.
         */
        std::optional<Matrix> cholesky() const;
    };

    struct Standardizer {
        std::vector<double> mean;
        std::vector<double> scale;

        std::vector<double> apply(const std::vector<double>& row) const;
    };

    /**
     * @brief Solves ridge regression (X^T W X + lambda I) B = X^T W Y for every column of Y.
     * @pre X.rows == Y.rows; weights empty or X.rows long. The last column of X is treated
     *      as the intercept and is not penalized when penalizeLast is false.
     * @post Returns std::nullopt when the normal system is not positive definite.
     * @throws std::invalid_argument when row dimensions mismatch.
     */
    static std::optional<Matrix> ridgeRegression(const Matrix& X,
                                                 const Matrix& Y,
                                                 double lambda,
                                                 const std::vector<double>& weights = {},
                                                 bool penalizeLast = false);

    /**
     * @brief Per-column mean/stddev over the rows; zero-variance columns get scale 1.
     */
    static Standardizer fitStandardizer(const std::vector<std::vector<double>>& rows);

    static void softmaxInPlace(std::vector<double>& logits);
};
