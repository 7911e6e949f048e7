#include "BuiltinFamilies.h"
#include "FamilyUtils.h"
#include "MathUtils.h"

#include <algorithm>
#include <cmath>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
struct KnnArtifact : ModelArtifact {
    ProblemType problemType = ProblemType::REGRESSION;
    size_t numClasses = 0;
    std::vector<double> quantileLevels;
    size_t k = 10;
    bool distanceWeighted = false;
    double smoothing = 0.1;
    MathUtils::Standardizer scaler;
    FeatureMatrix context;
    std::vector<double> labels;
    std::vector<double> sampleWeights;

    size_t memoryBytes() const override {
        const size_t width = context.empty() ? 0 : context.front().size();
        return sizeof(*this) + context.size() * (width + 2) * sizeof(double);
    }

    std::vector<double> predictRow(const std::vector<double>& raw) const {
        const auto neighbours = FamilyUtils::nearestNeighbours(context, scaler.apply(raw), k);
        std::vector<double> weights(neighbours.size(), 1.0);
        for (size_t i = 0; i < neighbours.size(); ++i) {
            if (distanceWeighted) weights[i] = 1.0 / (std::sqrt(neighbours[i].distanceSq) + 1e-6);
            if (!sampleWeights.empty()) weights[i] *= sampleWeights[neighbours[i].row];
        }

        if (isClassification(problemType)) {
            std::vector<double> votes(numClasses, smoothing);
            double total = smoothing * static_cast<double>(numClasses);
            for (size_t i = 0; i < neighbours.size(); ++i) {
                votes[static_cast<size_t>(labels[neighbours[i].row])] += weights[i];
                total += weights[i];
            }
            for (double& v : votes) v /= total;
            return FamilyUtils::toOutputRow(votes, problemType);
        }
        if (problemType == ProblemType::QUANTILE) {
            std::vector<double> values;
            values.reserve(neighbours.size());
            for (const auto& nb : neighbours) values.push_back(labels[nb.row]);
            return FamilyUtils::weightedQuantiles(values, weights, quantileLevels);
        }
        double sum = 0.0;
        double total = 0.0;
        for (size_t i = 0; i < neighbours.size(); ++i) {
            sum += weights[i] * labels[neighbours[i].row];
            total += weights[i];
        }
        return {total > 0.0 ? sum / total : 0.0};
    }
};
} // namespace

FamilyCapabilities KnnFamily::capabilities() const {
    FamilyCapabilities caps;
    caps.problemTypes = {ProblemType::BINARY, ProblemType::MULTICLASS, ProblemType::REGRESSION, ProblemType::QUANTILE};
    return caps;
}

ResourceEstimate KnnFamily::estimate(const DatasetTraits& traits, const Hyperparameters&) const {
    const double n = static_cast<double>(traits.rows);
    const double p = static_cast<double>(std::max<size_t>(1, traits.features));
    ResourceEstimate est;
    // Fold fit scores roughly n/5 held-out rows against the rest.
    est.fitSeconds = 1e-3 + n * n * 0.2 * p * 3e-9;
    est.memoryBytes = static_cast<size_t>(n * (p + 2) * sizeof(double) * 2);
    return est;
}

FitOutput KnnFamily::fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const {
    FamilyUtils::requireTrainingRows(train, name());
    const double k = hyperparameterOr(hp, "k", 10.0);
    if (!(k >= 1.0)) throw Strata::CandidateException("knn: k must be at least 1");

    auto artifact = std::make_unique<KnnArtifact>();
    artifact->problemType = ctx.problemType;
    artifact->numClasses = ctx.numClasses;
    artifact->quantileLevels = ctx.quantileLevels;
    artifact->k = FamilyUtils::countParameter(k, train.rowCount());
    artifact->distanceWeighted = hyperparameterOr(hp, "weighted", 0.0) != 0.0;
    artifact->smoothing = std::max(0.0, hyperparameterOr(hp, "smoothing", 0.1));
    artifact->scaler = MathUtils::fitStandardizer(train.features());
    artifact->context.reserve(train.rowCount());
    for (const auto& row : train.features()) artifact->context.push_back(artifact->scaler.apply(row));
    artifact->labels = train.labels();
    artifact->sampleWeights = train.weights();
    ctx.checkDeadline();

    FitOutput out;
    out.valPredictions.assign(val.rowCount(), {});
    const long long rows = static_cast<long long>(val.rowCount());
    bool timedOut = false;
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static) num_threads(std::max(1, ctx.numThreads)) if(ctx.numThreads > 1)
    #endif
    for (long long i = 0; i < rows; ++i) {
        bool stop = false;
        #ifdef USE_OPENMP
        #pragma omp atomic read
        #endif
        stop = timedOut;
        if (stop) continue;
        if ((i & 255) == 0 && Clock::now() > ctx.deadline) {
            #ifdef USE_OPENMP
            #pragma omp atomic write
            #endif
            timedOut = true;
            continue;
        }
        out.valPredictions[static_cast<size_t>(i)] = artifact->predictRow(val.features()[static_cast<size_t>(i)]);
    }
    if (timedOut) ctx.checkDeadline();
    FamilyUtils::requireFinite(out.valPredictions, name());
    out.artifact = std::move(artifact);
    return out;
}

PredictionMatrix KnnFamily::predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const {
    const auto& a = FamilyUtils::artifactAs<KnnArtifact>(artifact, name());
    PredictionMatrix out;
    out.reserve(rows.size());
    for (const auto& row : rows) out.push_back(a.predictRow(row));
    return out;
}
