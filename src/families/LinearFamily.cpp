#include "BuiltinFamilies.h"
#include "FamilyUtils.h"
#include "MathUtils.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kProbabilityFloor = 1e-3;

struct LinearArtifact : ModelArtifact {
    ProblemType problemType = ProblemType::REGRESSION;
    MathUtils::Standardizer scaler;
    // (features + 1) x outputs, intercept last.
    std::vector<std::vector<double>> beta;
    std::vector<double> quantileOffsets;

    size_t memoryBytes() const override {
        size_t bytes = sizeof(*this) + (scaler.mean.size() * 2 + quantileOffsets.size()) * sizeof(double);
        for (const auto& row : beta) bytes += row.size() * sizeof(double);
        return bytes;
    }
};

std::vector<double> linearOutputs(const LinearArtifact& a, const std::vector<double>& row) {
    const std::vector<double> z = a.scaler.apply(row);
    const size_t outputs = a.beta.empty() ? 0 : a.beta.front().size();
    std::vector<double> y(outputs, 0.0);
    for (size_t k = 0; k < outputs; ++k) {
        double sum = a.beta.back()[k];
        for (size_t j = 0; j < z.size(); ++j) sum += a.beta[j][k] * z[j];
        y[k] = sum;
    }
    return y;
}

std::vector<double> finishRow(const LinearArtifact& a, const std::vector<double>& raw) {
    switch (a.problemType) {
        case ProblemType::BINARY:
        case ProblemType::MULTICLASS: {
            std::vector<double> probs = raw;
            double total = 0.0;
            for (double& p : probs) {
                p = std::clamp(p, kProbabilityFloor, 1.0);
                total += p;
            }
            for (double& p : probs) p /= total;
            return FamilyUtils::toOutputRow(probs, a.problemType);
        }
        case ProblemType::REGRESSION:
            return {raw.at(0)};
        case ProblemType::QUANTILE:
            return FamilyUtils::quantileRow(raw.at(0), a.quantileOffsets);
    }
    return raw;
}
} // namespace

FamilyCapabilities LinearFamily::capabilities() const {
    FamilyCapabilities caps;
    caps.problemTypes = {ProblemType::BINARY, ProblemType::MULTICLASS, ProblemType::REGRESSION, ProblemType::QUANTILE};
    return caps;
}

ResourceEstimate LinearFamily::estimate(const DatasetTraits& traits, const Hyperparameters&) const {
    const double p = static_cast<double>(traits.features + 1);
    const double outputs = static_cast<double>(std::max<size_t>(1, traits.classes));
    ResourceEstimate est;
    est.fitSeconds = 1e-3 + static_cast<double>(traits.rows) * p * p * 4e-9 + p * p * p * outputs * 1e-9;
    est.memoryBytes = static_cast<size_t>(p * p * sizeof(double) * 2 + static_cast<double>(traits.rows) * p * sizeof(double));
    return est;
}

FitOutput LinearFamily::fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const {
    FamilyUtils::requireTrainingRows(train, name());
    const double lambda = hyperparameterOr(hp, "lambda", 1.0);
    if (!(lambda >= 0.0)) throw Strata::CandidateException("linear: lambda must be non-negative");

    auto artifact = std::make_unique<LinearArtifact>();
    artifact->problemType = ctx.problemType;
    artifact->scaler = MathUtils::fitStandardizer(train.features());

    const size_t n = train.rowCount();
    const size_t p = train.featureCount();
    const bool classification = isClassification(ctx.problemType);
    const size_t outputs = classification ? ctx.numClasses : 1;

    MathUtils::Matrix X(n, p + 1);
    MathUtils::Matrix Y(n, outputs);
    for (size_t i = 0; i < n; ++i) {
        X.data[i] = artifact->scaler.apply(train.features()[i]);
        X.data[i].push_back(1.0);
        if (classification) {
            Y.at(i, static_cast<size_t>(train.labels()[i])) = 1.0;
        } else {
            Y.at(i, 0) = train.labels()[i];
        }
    }
    ctx.checkDeadline();

    auto beta = MathUtils::ridgeRegression(X, Y, lambda * static_cast<double>(n) / 100.0, train.weights());
    if (!beta) throw Strata::NumericalException("linear: normal equations are not positive definite");
    artifact->beta = beta->data;
    ctx.checkDeadline();

    if (ctx.problemType == ProblemType::QUANTILE) {
        std::vector<double> points(n, 0.0);
        for (size_t i = 0; i < n; ++i) points[i] = linearOutputs(*artifact, train.features()[i]).at(0);
        artifact->quantileOffsets = FamilyUtils::residualOffsets(train.labels(), points, ctx.quantileLevels);
    }

    FitOutput out;
    out.valPredictions.reserve(val.rowCount());
    for (const auto& row : val.features()) out.valPredictions.push_back(finishRow(*artifact, linearOutputs(*artifact, row)));
    FamilyUtils::requireFinite(out.valPredictions, name());
    out.artifact = std::move(artifact);
    return out;
}

PredictionMatrix LinearFamily::predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const {
    const auto& a = FamilyUtils::artifactAs<LinearArtifact>(artifact, name());
    PredictionMatrix out;
    out.reserve(rows.size());
    for (const auto& row : rows) out.push_back(finishRow(a, linearOutputs(a, row)));
    return out;
}
