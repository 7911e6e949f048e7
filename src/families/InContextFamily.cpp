#include "BuiltinFamilies.h"
#include "CommonUtils.h"
#include "FamilyUtils.h"
#include "MathUtils.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <numeric>
#include <random>
#include <stdexcept>

namespace {
constexpr size_t kMaxCount = 1u << 24;

struct PretrainedParams {
    double temperature = 1.0;
    size_t neighbours = 32;
    size_t maxContext = 4096;
    double smoothing = 0.05;
};

PretrainedParams loadPretrained(const std::string& path) {
    if (path.empty()) {
        throw Strata::MissingDependencyException("incontext: no pretrained weights handle");
    }
    std::ifstream in(path);
    if (!in) throw Strata::MissingDependencyException("incontext: cannot read pretrained weights at " + path);

    PretrainedParams params;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = CommonUtils::trim(line);
        if (line.empty()) continue;
        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            throw Strata::MissingDependencyException("incontext: malformed weights line " + std::to_string(lineNo));
        }
        const std::string key = CommonUtils::toLower(CommonUtils::trim(line.substr(0, colon)));
        const std::string value = CommonUtils::trim(line.substr(colon + 1));
        double parsed = 0.0;
        const bool numeric = key == "temperature" || key == "neighbors" || key == "max_context" || key == "smoothing";
        if (!numeric) continue;
        try {
            size_t pos = 0;
            parsed = std::stod(value, &pos);
            if (pos != value.size()) throw std::invalid_argument(value);
        } catch (const std::exception&) {
            throw Strata::MissingDependencyException("incontext: invalid value for '" + key + "' in " + path);
        }
        if (key == "temperature") params.temperature = parsed;
        if (key == "neighbors") params.neighbours = FamilyUtils::countParameter(parsed, kMaxCount);
        if (key == "max_context") params.maxContext = FamilyUtils::countParameter(parsed, kMaxCount);
        if (key == "smoothing") params.smoothing = std::max(0.0, parsed);
    }
    if (!(params.temperature > 0.0)) {
        throw Strata::MissingDependencyException("incontext: temperature must be positive in " + path);
    }
    return params;
}

struct InContextArtifact : ModelArtifact {
    ProblemType problemType = ProblemType::REGRESSION;
    size_t numClasses = 0;
    std::vector<double> quantileLevels;
    PretrainedParams params;
    MathUtils::Standardizer scaler;
    FeatureMatrix context;
    std::vector<double> labels;

    size_t memoryBytes() const override {
        const size_t width = context.empty() ? 0 : context.front().size();
        return sizeof(*this) + context.size() * (width + 1) * sizeof(double);
    }

    std::vector<double> predictRow(const std::vector<double>& raw) const {
        const std::vector<double> query = scaler.apply(raw);
        const auto neighbours = FamilyUtils::nearestNeighbours(context, query, params.neighbours);
        std::vector<double> logits(neighbours.size(), 0.0);
        const double dims = static_cast<double>(std::max<size_t>(1, query.size()));
        for (size_t i = 0; i < neighbours.size(); ++i) {
            logits[i] = -neighbours[i].distanceSq / (dims * params.temperature);
        }
        MathUtils::softmaxInPlace(logits);

        if (isClassification(problemType)) {
            std::vector<double> probs(numClasses, params.smoothing);
            double total = params.smoothing * static_cast<double>(numClasses);
            for (size_t i = 0; i < neighbours.size(); ++i) {
                probs[static_cast<size_t>(labels[neighbours[i].row])] += logits[i];
                total += logits[i];
            }
            for (double& p : probs) p /= total;
            return FamilyUtils::toOutputRow(probs, problemType);
        }
        if (problemType == ProblemType::QUANTILE) {
            std::vector<double> values;
            values.reserve(neighbours.size());
            for (const auto& nb : neighbours) values.push_back(labels[nb.row]);
            return FamilyUtils::weightedQuantiles(values, logits, quantileLevels);
        }
        double sum = 0.0;
        for (size_t i = 0; i < neighbours.size(); ++i) sum += logits[i] * labels[neighbours[i].row];
        return {sum};
    }
};
} // namespace

FamilyCapabilities InContextFamily::capabilities() const {
    FamilyCapabilities caps;
    caps.problemTypes = {ProblemType::BINARY, ProblemType::MULTICLASS, ProblemType::REGRESSION, ProblemType::QUANTILE};
    caps.gpuCapable = true;
    caps.gpuShareable = true;
    return caps;
}

ResourceEstimate InContextFamily::estimate(const DatasetTraits& traits, const Hyperparameters& hp) const {
    const double context = std::min(static_cast<double>(traits.rows), hyperparameterOr(hp, "max_context", 4096.0));
    const double queries = static_cast<double>(traits.rows) * 0.2;
    ResourceEstimate est;
    est.fitSeconds = 0.01 + context * queries * static_cast<double>(std::max<size_t>(1, traits.features)) * 3e-9;
    est.memoryBytes = static_cast<size_t>(context * static_cast<double>(traits.features + 1) * sizeof(double) + 64.0 * 1024 * 1024);
    return est;
}

FitOutput InContextFamily::fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const {
    FamilyUtils::requireTrainingRows(train, name());
    auto artifact = std::make_unique<InContextArtifact>();
    artifact->params = loadPretrained(ctx.weightsPath);
    if (hp.count("max_context")) artifact->params.maxContext = FamilyUtils::countParameter(hp.at("max_context"), train.rowCount());
    artifact->problemType = ctx.problemType;
    artifact->numClasses = ctx.numClasses;
    artifact->quantileLevels = ctx.quantileLevels;
    artifact->scaler = MathUtils::fitStandardizer(train.features());

    std::vector<size_t> rows(train.rowCount());
    std::iota(rows.begin(), rows.end(), 0);
    if (rows.size() > artifact->params.maxContext) {
        std::mt19937 rng(ctx.seed);
        std::shuffle(rows.begin(), rows.end(), rng);
        rows.resize(artifact->params.maxContext);
        std::sort(rows.begin(), rows.end());
    }
    artifact->context.reserve(rows.size());
    artifact->labels.reserve(rows.size());
    for (size_t r : rows) {
        artifact->context.push_back(artifact->scaler.apply(train.features()[r]));
        artifact->labels.push_back(train.labels()[r]);
    }

    FitOutput out;
    out.valPredictions.reserve(val.rowCount());
    for (size_t i = 0; i < val.rowCount(); ++i) {
        if ((i & 255) == 0) ctx.checkDeadline();
        out.valPredictions.push_back(artifact->predictRow(val.features()[i]));
    }
    FamilyUtils::requireFinite(out.valPredictions, name());
    out.artifact = std::move(artifact);
    return out;
}

PredictionMatrix InContextFamily::predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const {
    const auto& a = FamilyUtils::artifactAs<InContextArtifact>(artifact, name());
    PredictionMatrix out;
    out.reserve(rows.size());
    for (const auto& row : rows) out.push_back(a.predictRow(row));
    return out;
}
