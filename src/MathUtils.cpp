#include "MathUtils.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kPivotEpsilon = 1e-12;

bool solveLower(const MathUtils::Matrix& L, const std::vector<double>& b, std::vector<double>& x) {
    const size_t n = L.rows;
    x.assign(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        double rhs = b[i];
        for (size_t j = 0; j < i; ++j) rhs -= L.at(i, j) * x[j];
        const double diag = L.at(i, i);
        if (std::abs(diag) <= kPivotEpsilon) return false;
        x[i] = rhs / diag;
    }
    return true;
}

bool solveUpperFromLowerTranspose(const MathUtils::Matrix& L, const std::vector<double>& b, std::vector<double>& x) {
    const size_t n = L.rows;
    x.assign(n, 0.0);
    for (size_t i = n; i-- > 0;) {
        double rhs = b[i];
        for (size_t j = i + 1; j < n; ++j) rhs -= L.at(j, i) * x[j];
        const double diag = L.at(i, i);
        if (std::abs(diag) <= kPivotEpsilon) return false;
        x[i] = rhs / diag;
    }
    return true;
}
} // namespace

std::optional<MathUtils::Matrix> MathUtils::Matrix::cholesky() const {
    if (rows != cols) throw std::invalid_argument("Cholesky requires a square matrix.");
    const size_t n = rows;
    Matrix L(n, n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j <= i; ++j) {
            double sum = at(i, j);
            for (size_t k = 0; k < j; ++k) sum -= L.at(i, k) * L.at(j, k);
            if (i == j) {
                if (!(sum > kPivotEpsilon)) return std::nullopt;
                L.at(i, i) = std::sqrt(sum);
            } else {
                L.at(i, j) = sum / L.at(j, j);
            }
        }
    }
    return L;
}

std::optional<MathUtils::Matrix> MathUtils::ridgeRegression(const Matrix& X,
                                                            const Matrix& Y,
                                                            double lambda,
                                                            const std::vector<double>& weights,
                                                            bool penalizeLast) {
    if (X.rows != Y.rows) throw std::invalid_argument("X and Y row dimensions must match for ridge regression.");
    if (!weights.empty() && weights.size() != X.rows) {
        throw std::invalid_argument("Weight vector length must match X rows.");
    }
    const size_t p = X.cols;
    const size_t m = Y.cols;

    Matrix gram(p, p);
    Matrix rhs(p, m);
    for (size_t r = 0; r < X.rows; ++r) {
        const double w = weights.empty() ? 1.0 : weights[r];
        if (w <= 0.0) continue;
        const auto& xr = X.data[r];
        for (size_t i = 0; i < p; ++i) {
            const double wi = w * xr[i];
            if (wi == 0.0) continue;
            auto& gramRow = gram.data[i];
            #ifdef USE_OPENMP
            #pragma omp simd
            #endif
            for (size_t j = 0; j <= i; ++j) gramRow[j] += wi * xr[j];
            for (size_t k = 0; k < m; ++k) rhs.at(i, k) += wi * Y.at(r, k);
        }
    }
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = 0; j < i; ++j) gram.at(j, i) = gram.at(i, j);
        const bool intercept = (i + 1 == p) && !penalizeLast;
        gram.at(i, i) += intercept ? 1e-9 : std::max(0.0, lambda);
    }

    const auto L = gram.cholesky();
    if (!L) return std::nullopt;

    Matrix beta(p, m);
    std::vector<double> b(p), z, x;
    for (size_t k = 0; k < m; ++k) {
        for (size_t i = 0; i < p; ++i) b[i] = rhs.at(i, k);
        if (!solveLower(*L, b, z)) return std::nullopt;
        if (!solveUpperFromLowerTranspose(*L, z, x)) return std::nullopt;
        for (size_t i = 0; i < p; ++i) {
            if (!std::isfinite(x[i])) return std::nullopt;
            beta.at(i, k) = x[i];
        }
    }
    return beta;
}

std::vector<double> MathUtils::Standardizer::apply(const std::vector<double>& row) const {
    std::vector<double> out(row.size(), 0.0);
    for (size_t j = 0; j < row.size() && j < mean.size(); ++j) {
        out[j] = (row[j] - mean[j]) / scale[j];
    }
    return out;
}

MathUtils::Standardizer MathUtils::fitStandardizer(const std::vector<std::vector<double>>& rows) {
    Standardizer s;
    if (rows.empty()) return s;
    const size_t p = rows.front().size();
    s.mean.assign(p, 0.0);
    s.scale.assign(p, 1.0);
    const double n = static_cast<double>(rows.size());
    for (const auto& r : rows) {
        for (size_t j = 0; j < p; ++j) s.mean[j] += r[j];
    }
    for (double& m : s.mean) m /= n;
    std::vector<double> var(p, 0.0);
    for (const auto& r : rows) {
        for (size_t j = 0; j < p; ++j) {
            const double d = r[j] - s.mean[j];
            var[j] += d * d;
        }
    }
    for (size_t j = 0; j < p; ++j) {
        const double sd = std::sqrt(var[j] / n);
        s.scale[j] = sd > kPivotEpsilon ? sd : 1.0;
    }
    return s;
}

void MathUtils::softmaxInPlace(std::vector<double>& logits) {
    if (logits.empty()) return;
    const double maxLogit = *std::max_element(logits.begin(), logits.end());
    double sum = 0.0;
    for (double& v : logits) {
        v = std::exp(v - maxLogit);
        sum += v;
    }
    if (!(sum > 0.0) || !std::isfinite(sum)) {
        std::fill(logits.begin(), logits.end(), 1.0 / static_cast<double>(logits.size()));
        return;
    }
    for (double& v : logits) v /= sum;
}
