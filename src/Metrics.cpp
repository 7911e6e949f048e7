#include "Metrics.h"
#include "CommonUtils.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kProbabilityClip = 1e-15;

void checkShape(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w) {
    if (labels.size() != p.size()) {
        throw Strata::NumericalException("Prediction rows (" + std::to_string(p.size())
                                         + ") do not match label rows (" + std::to_string(labels.size()) + ")");
    }
    if (!w.empty() && w.size() != labels.size()) {
        throw Strata::NumericalException("Sample weight length does not match label rows");
    }
    if (labels.empty()) throw Strata::NumericalException("Cannot score an empty prediction set");
}

double weightAt(const std::vector<double>& w, size_t i) {
    return w.empty() ? 1.0 : w[i];
}

double finishMean(double sum, double weightSum) {
    if (!(weightSum > 0.0)) throw Strata::NumericalException("Sample weights sum to zero");
    const double out = sum / weightSum;
    if (!std::isfinite(out)) throw Strata::NumericalException("Metric produced a non-finite value");
    return out;
}

size_t argmax(const std::vector<double>& row) {
    return static_cast<size_t>(std::distance(row.begin(), std::max_element(row.begin(), row.end())));
}
} // namespace

double EvalMetric::compute(const std::vector<double>& labels,
                           const PredictionMatrix& predictions,
                           const std::vector<double>& weights) const {
    return score(labels, predictions, weights);
}

namespace Metrics {
double logLoss(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w, bool binary) {
    checkShape(labels, p, w);
    double sum = 0.0;
    double weightSum = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        const size_t y = static_cast<size_t>(labels[i]);
        double prob = 0.0;
        if (binary) {
            const double p1 = std::clamp(p[i].at(0), kProbabilityClip, 1.0 - kProbabilityClip);
            prob = y == 1 ? p1 : 1.0 - p1;
        } else {
            if (y >= p[i].size()) throw Strata::NumericalException("Class index outside prediction width");
            prob = std::clamp(p[i][y], kProbabilityClip, 1.0 - kProbabilityClip);
        }
        const double wi = weightAt(w, i);
        sum += -wi * std::log(prob);
        weightSum += wi;
    }
    return finishMean(sum, weightSum);
}

double accuracy(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w, bool binary) {
    checkShape(labels, p, w);
    double hits = 0.0;
    double weightSum = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        const size_t predicted = binary ? (p[i].at(0) >= 0.5 ? 1u : 0u) : argmax(p[i]);
        const double wi = weightAt(w, i);
        if (predicted == static_cast<size_t>(labels[i])) hits += wi;
        weightSum += wi;
    }
    return finishMean(hits, weightSum);
}

double rmse(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w) {
    checkShape(labels, p, w);
    double sum = 0.0;
    double weightSum = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        const double d = p[i].at(0) - labels[i];
        const double wi = weightAt(w, i);
        sum += wi * d * d;
        weightSum += wi;
    }
    return std::sqrt(finishMean(sum, weightSum));
}

double mae(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w) {
    checkShape(labels, p, w);
    double sum = 0.0;
    double weightSum = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        const double wi = weightAt(w, i);
        sum += wi * std::abs(p[i].at(0) - labels[i]);
        weightSum += wi;
    }
    return finishMean(sum, weightSum);
}

double r2(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w) {
    checkShape(labels, p, w);
    double weightSum = 0.0;
    double mean = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        mean += weightAt(w, i) * labels[i];
        weightSum += weightAt(w, i);
    }
    mean = finishMean(mean, weightSum);
    double ssRes = 0.0;
    double ssTot = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        const double wi = weightAt(w, i);
        const double e = labels[i] - p[i].at(0);
        const double d = labels[i] - mean;
        ssRes += wi * e * e;
        ssTot += wi * d * d;
    }
    if (ssTot <= 0.0) return ssRes <= 0.0 ? 1.0 : 0.0;
    return 1.0 - ssRes / ssTot;
}

double pinball(const std::vector<double>& labels, const PredictionMatrix& p, const std::vector<double>& w,
               const std::vector<double>& quantileLevels) {
    checkShape(labels, p, w);
    if (quantileLevels.empty()) throw Strata::NumericalException("Pinball loss needs quantile levels");
    double sum = 0.0;
    double weightSum = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (p[i].size() != quantileLevels.size()) {
            throw Strata::NumericalException("Quantile prediction width does not match quantile levels");
        }
        double rowLoss = 0.0;
        for (size_t q = 0; q < quantileLevels.size(); ++q) {
            const double diff = labels[i] - p[i][q];
            const double tau = quantileLevels[q];
            rowLoss += diff >= 0.0 ? tau * diff : (tau - 1.0) * diff;
        }
        const double wi = weightAt(w, i);
        sum += wi * rowLoss / static_cast<double>(quantileLevels.size());
        weightSum += wi;
    }
    return finishMean(sum, weightSum);
}

const std::vector<std::string>& knownNames() {
    static const std::vector<std::string> names = {"log_loss", "accuracy", "rmse", "mae", "r2", "pinball"};
    return names;
}

EvalMetric defaultFor(ProblemType problemType, const std::vector<double>& quantileLevels) {
    switch (problemType) {
        case ProblemType::BINARY:
        case ProblemType::MULTICLASS:
            return byName("log_loss", problemType, quantileLevels);
        case ProblemType::REGRESSION:
            return byName("rmse", problemType, quantileLevels);
        case ProblemType::QUANTILE:
            return byName("pinball", problemType, quantileLevels);
    }
    return byName("rmse", ProblemType::REGRESSION);
}

EvalMetric byName(const std::string& rawName,
                  ProblemType problemType,
                  const std::vector<double>& quantileLevels) {
    const std::string name = CommonUtils::toLower(CommonUtils::trim(rawName));
    if (name.empty() || name == "auto") return defaultFor(problemType, quantileLevels);

    const bool classification = isClassification(problemType);
    const bool binary = problemType == ProblemType::BINARY;
    auto incompatible = [&]() {
        return Strata::ConfigurationException("eval_metric '" + name + "' is not valid for "
                                              + problemTypeName(problemType) + " problems");
    };

    EvalMetric m;
    m.name = name;
    if (name == "log_loss") {
        if (!classification) throw incompatible();
        m.higherIsBetter = false;
        m.optimum = 0.0;
        m.score = [binary](const std::vector<double>& y, const PredictionMatrix& p, const std::vector<double>& w) {
            return logLoss(y, p, w, binary);
        };
    } else if (name == "accuracy") {
        if (!classification) throw incompatible();
        m.higherIsBetter = true;
        m.optimum = 1.0;
        m.score = [binary](const std::vector<double>& y, const PredictionMatrix& p, const std::vector<double>& w) {
            return accuracy(y, p, w, binary);
        };
    } else if (name == "rmse" || name == "mae" || name == "r2") {
        if (problemType != ProblemType::REGRESSION) throw incompatible();
        if (name == "rmse") {
            m.score = rmse;
        } else if (name == "mae") {
            m.score = mae;
        } else {
            m.higherIsBetter = true;
            m.optimum = 1.0;
            m.score = r2;
        }
    } else if (name == "pinball") {
        if (problemType != ProblemType::QUANTILE) throw incompatible();
        m.score = [quantileLevels](const std::vector<double>& y, const PredictionMatrix& p, const std::vector<double>& w) {
            return pinball(y, p, w, quantileLevels);
        };
    } else {
        throw Strata::ConfigurationException("Unknown eval_metric '" + name + "'");
    }
    return m;
}
} // namespace Metrics
