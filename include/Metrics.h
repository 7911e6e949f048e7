#pragma once
#include "Dataset.h"

#include <functional>
#include <string>
#include <vector>

/**
 * Validation metric with a declared direction. The optimizer-facing view is toLoss(),
 * which is always lower-is-better regardless of direction.
 */
struct EvalMetric {
    using ScoreFn = std::function<double(const std::vector<double>& labels,
                                         const PredictionMatrix& predictions,
                                         const std::vector<double>& weights)>;

    std::string name;
    bool higherIsBetter = false;
    double optimum = 0.0;
    ScoreFn score;

    double compute(const std::vector<double>& labels,
                   const PredictionMatrix& predictions,
                   const std::vector<double>& weights = {}) const;

    double toLoss(double value) const noexcept {
        return higherIsBetter ? optimum - value : value - optimum;
    }

    bool better(double a, double b) const noexcept {
        return higherIsBetter ? a > b : a < b;
    }
};

namespace Metrics {
/**
 * @brief Resolves a metric by name for a problem type ("auto" picks the default).
 * @throws Strata::ConfigurationException for unknown names or names incompatible with the problem type.
 */
EvalMetric byName(const std::string& name,
                  ProblemType problemType,
                  const std::vector<double>& quantileLevels = {});

EvalMetric defaultFor(ProblemType problemType, const std::vector<double>& quantileLevels = {});

// Names accepted by byName(), in documentation order.
const std::vector<std::string>& knownNames();

double logLoss(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w, bool binary);
double accuracy(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w, bool binary);
double rmse(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w);
double mae(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w);
double r2(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w);
double pinball(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w,
               const std::vector<double>& quantileLevels);
} // namespace Metrics
