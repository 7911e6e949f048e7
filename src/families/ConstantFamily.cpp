#include "BuiltinFamilies.h"
#include "FamilyUtils.h"

namespace {
struct ConstantArtifact : ModelArtifact {
    std::vector<double> row;
    size_t memoryBytes() const override { return sizeof(*this) + row.size() * sizeof(double); }
};
} // namespace

FamilyCapabilities ConstantFamily::capabilities() const {
    FamilyCapabilities caps;
    caps.problemTypes = {ProblemType::BINARY, ProblemType::MULTICLASS, ProblemType::REGRESSION, ProblemType::QUANTILE};
    return caps;
}

ResourceEstimate ConstantFamily::estimate(const DatasetTraits& traits, const Hyperparameters&) const {
    ResourceEstimate est;
    est.fitSeconds = 1e-4 + static_cast<double>(traits.rows) * 1e-8;
    est.memoryBytes = 1024;
    return est;
}

FitOutput ConstantFamily::fit(const Dataset& train, const Dataset& val, const Hyperparameters&, const FitContext& ctx) const {
    FamilyUtils::requireTrainingRows(train, name());
    auto artifact = std::make_unique<ConstantArtifact>();

    switch (ctx.problemType) {
        case ProblemType::BINARY:
        case ProblemType::MULTICLASS:
            artifact->row = FamilyUtils::toOutputRow(FamilyUtils::classPriors(train, ctx.numClasses, 0.5), ctx.problemType);
            break;
        case ProblemType::REGRESSION: {
            double sum = 0.0;
            double weightSum = 0.0;
            for (size_t i = 0; i < train.rowCount(); ++i) {
                const double w = FamilyUtils::rowWeight(train, i);
                sum += w * train.labels()[i];
                weightSum += w;
            }
            if (!(weightSum > 0.0)) throw Strata::NumericalException("training weights sum to zero");
            artifact->row = {sum / weightSum};
            break;
        }
        case ProblemType::QUANTILE:
            artifact->row = FamilyUtils::weightedQuantiles(train.labels(), train.weights(), ctx.quantileLevels);
            break;
    }

    FitOutput out;
    out.valPredictions = PredictionMatrix(val.rowCount(), artifact->row);
    out.artifact = std::move(artifact);
    return out;
}

PredictionMatrix ConstantFamily::predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const {
    const auto& a = FamilyUtils::artifactAs<ConstantArtifact>(artifact, name());
    return PredictionMatrix(rows.size(), a.row);
}
