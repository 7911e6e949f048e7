#include "FamilyUtils.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace FamilyUtils {

void requireTrainingRows(const Dataset& train, const std::string& family) {
    if (train.rowCount() == 0 || !train.hasLabels()) {
        throw Strata::CandidateException("Family '" + family + "' received no labelled training rows");
    }
}

size_t countParameter(double value, size_t upper) {
    const size_t bound = std::max<size_t>(1, upper);
    if (!(value >= 1.0)) return 1;
    if (value >= static_cast<double>(bound)) return bound;
    return static_cast<size_t>(value);
}

std::vector<double> classPriors(const Dataset& train, size_t numClasses, double pseudoCount) {
    std::vector<double> counts(numClasses, pseudoCount);
    for (size_t i = 0; i < train.rowCount(); ++i) {
        const size_t k = static_cast<size_t>(train.labels()[i]);
        if (k < numClasses) counts[k] += rowWeight(train, i);
    }
    const double total = std::accumulate(counts.begin(), counts.end(), 0.0);
    if (!(total > 0.0)) return std::vector<double>(numClasses, 1.0 / static_cast<double>(std::max<size_t>(1, numClasses)));
    for (double& c : counts) c /= total;
    return counts;
}

std::vector<double> toOutputRow(const std::vector<double>& classProbabilities, ProblemType problemType) {
    if (problemType == ProblemType::BINARY) {
        return {classProbabilities.size() > 1 ? classProbabilities[1] : 0.5};
    }
    return classProbabilities;
}

std::vector<double> weightedQuantiles(const std::vector<double>& values,
                                      const std::vector<double>& weights,
                                      const std::vector<double>& levels) {
    std::vector<double> out(levels.size(), 0.0);
    if (values.empty()) return out;
    if (weights.empty()) {
        for (size_t q = 0; q < levels.size(); ++q) out[q] = CommonUtils::quantileByNth(values, levels[q]);
        return out;
    }

    std::vector<size_t> order(values.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) { return values[a] < values[b]; });
    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (!(total > 0.0)) {
        for (size_t q = 0; q < levels.size(); ++q) out[q] = CommonUtils::quantileByNth(values, levels[q]);
        return out;
    }

    for (size_t q = 0; q < levels.size(); ++q) {
        const double target = levels[q] * total;
        double cumulative = 0.0;
        out[q] = values[order.back()];
        for (size_t idx : order) {
            cumulative += weights[idx];
            if (cumulative >= target) {
                out[q] = values[idx];
                break;
            }
        }
    }
    return out;
}

std::vector<double> residualOffsets(const std::vector<double>& labels,
                                    const std::vector<double>& pointPredictions,
                                    const std::vector<double>& levels) {
    std::vector<double> residuals(labels.size(), 0.0);
    for (size_t i = 0; i < labels.size(); ++i) residuals[i] = labels[i] - pointPredictions[i];
    std::vector<double> offsets(levels.size(), 0.0);
    if (residuals.empty()) return offsets;
    for (size_t q = 0; q < levels.size(); ++q) offsets[q] = CommonUtils::quantileByNth(residuals, levels[q]);
    return offsets;
}

std::vector<double> quantileRow(double point, const std::vector<double>& offsets) {
    std::vector<double> row(offsets.size(), point);
    for (size_t q = 0; q < offsets.size(); ++q) row[q] += offsets[q];
    std::sort(row.begin(), row.end());
    return row;
}

std::vector<Neighbour> nearestNeighbours(const FeatureMatrix& context, const std::vector<double>& query, size_t k) {
    std::vector<Neighbour> all(context.size());
    for (size_t r = 0; r < context.size(); ++r) {
        double d = 0.0;
        const auto& row = context[r];
        for (size_t j = 0; j < row.size() && j < query.size(); ++j) {
            const double diff = row[j] - query[j];
            d += diff * diff;
        }
        all[r] = {d, r};
    }
    k = std::min(k, all.size());
    auto closer = [](const Neighbour& a, const Neighbour& b) {
        if (a.distanceSq != b.distanceSq) return a.distanceSq < b.distanceSq;
        return a.row < b.row;
    };
    std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(k), all.end(), closer);
    all.resize(k);
    return all;
}

void requireFinite(const PredictionMatrix& predictions, const std::string& family) {
    for (const auto& row : predictions) {
        for (double v : row) {
            if (!std::isfinite(v)) {
                throw Strata::NumericalException("Family '" + family + "' produced a non-finite prediction");
            }
        }
    }
}

} // namespace FamilyUtils
