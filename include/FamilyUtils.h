#pragma once
#include "ModelFamily.h"
#include "StrataExceptions.h"

#include <string>
#include <vector>

// Shared helpers for the built-in model families.
namespace FamilyUtils {

template <typename T>
const T& artifactAs(const ModelArtifact& artifact, const std::string& family) {
    const T* typed = dynamic_cast<const T*>(&artifact);
    if (typed == nullptr) {
        throw Strata::CandidateException("Artifact passed to family '" + family + "' was produced by another family");
    }
    return *typed;
}

inline double rowWeight(const Dataset& data, size_t row) {
    return data.hasWeights() ? data.weights()[row] : 1.0;
}

void requireTrainingRows(const Dataset& train, const std::string& family);

// Count-valued hyperparameter clamped to [1, upper]; NaN maps to 1.
size_t countParameter(double value, size_t upper);

// Class frequencies with an additive pseudo-count per class, normalized to sum to 1.
std::vector<double> classPriors(const Dataset& train, size_t numClasses, double pseudoCount = 0.0);

// Collapses K class probabilities into the output layout (binary keeps P(class 1)).
std::vector<double> toOutputRow(const std::vector<double>& classProbabilities, ProblemType problemType);

/**
 * @brief Weighted empirical quantiles; empty weights mean uniform.
 * @pre values non-empty; levels ascending in (0,1).
 */
std::vector<double> weightedQuantiles(const std::vector<double>& values,
                                      const std::vector<double>& weights,
                                      const std::vector<double>& levels);

// Residual quantile offsets for families that only produce a point estimate.
std::vector<double> residualOffsets(const std::vector<double>& labels,
                                    const std::vector<double>& pointPredictions,
                                    const std::vector<double>& levels);

std::vector<double> quantileRow(double point, const std::vector<double>& offsets);

struct Neighbour {
    double distanceSq = 0.0;
    size_t row = 0;
};

// k closest context rows by squared Euclidean distance, nearest first (ties by row index).
std::vector<Neighbour> nearestNeighbours(const FeatureMatrix& context, const std::vector<double>& query, size_t k);

// Rejects NaN/inf in a prediction block.
void requireFinite(const PredictionMatrix& predictions, const std::string& family);

} // namespace FamilyUtils
