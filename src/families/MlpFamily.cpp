#include "BuiltinFamilies.h"
#include "FamilyUtils.h"
#include "MathUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

namespace {
constexpr double kBeta1 = 0.9;
constexpr double kBeta2 = 0.999;
constexpr double kAdamEpsilon = 1e-8;
constexpr size_t kMaxHidden = 4096;
constexpr size_t kMaxDepth = 16;
constexpr size_t kMaxEpochs = 100000;
constexpr double kProbabilityClip = 1e-15;

struct DenseLayer {
    size_t in = 0;
    size_t out = 0;
    std::vector<double> w;  // out x in, row-major
    std::vector<double> b;
    std::vector<double> mW, vW, mB, vB;
    std::vector<double> gW, gB;

    DenseLayer(size_t inSize, size_t outSize, std::mt19937& rng)
        : in(inSize), out(outSize), w(inSize * outSize), b(outSize, 0.0) {
        const double limit = std::sqrt(6.0 / static_cast<double>(inSize + outSize));
        std::uniform_real_distribution<double> dist(-limit, limit);
        for (double& v : w) v = dist(rng);
        mW.assign(w.size(), 0.0);
        vW.assign(w.size(), 0.0);
        gW.assign(w.size(), 0.0);
        mB.assign(out, 0.0);
        vB.assign(out, 0.0);
        gB.assign(out, 0.0);
    }

    void dropOptimizerState() {
        std::vector<double>().swap(mW);
        std::vector<double>().swap(vW);
        std::vector<double>().swap(gW);
        std::vector<double>().swap(mB);
        std::vector<double>().swap(vB);
        std::vector<double>().swap(gB);
    }
};

struct MlpArtifact : ModelArtifact {
    ProblemType problemType = ProblemType::REGRESSION;
    MathUtils::Standardizer scaler;
    double targetMean = 0.0;
    double targetScale = 1.0;
    std::vector<DenseLayer> layers;

    size_t memoryBytes() const override {
        size_t bytes = sizeof(*this) + scaler.mean.size() * 2 * sizeof(double);
        for (const auto& l : layers) bytes += (l.w.size() + l.b.size()) * sizeof(double);
        return bytes;
    }

    // activations[l] is the input of layer l; the returned vector is the raw output.
    std::vector<double> forward(const std::vector<double>& x, std::vector<std::vector<double>>* activations) const {
        std::vector<double> a = x;
        for (size_t l = 0; l < layers.size(); ++l) {
            const DenseLayer& layer = layers[l];
            if (activations) (*activations)[l] = a;
            std::vector<double> z(layer.out, 0.0);
            for (size_t o = 0; o < layer.out; ++o) {
                double sum = layer.b[o];
                const double* row = &layer.w[o * layer.in];
                for (size_t i = 0; i < layer.in; ++i) sum += row[i] * a[i];
                z[o] = (l + 1 < layers.size()) ? std::tanh(sum) : sum;
            }
            a = std::move(z);
        }
        return a;
    }

    std::vector<double> finish(std::vector<double> raw) const {
        switch (problemType) {
            case ProblemType::BINARY:
            case ProblemType::MULTICLASS:
                MathUtils::softmaxInPlace(raw);
                return FamilyUtils::toOutputRow(raw, problemType);
            case ProblemType::REGRESSION:
                return {raw.at(0) * targetScale + targetMean};
            case ProblemType::QUANTILE:
                for (double& v : raw) v = v * targetScale + targetMean;
                std::sort(raw.begin(), raw.end());
                return raw;
        }
        return raw;
    }
};

struct TrainingParams {
    size_t epochs = 60;
    size_t batch = 32;
    double lr = 0.01;
    double l2 = 1e-4;
    int patience = 8;
    double minDelta = 1e-4;
};

class MlpTrainer {
public:
    MlpTrainer(MlpArtifact& net, const FitContext& ctx) : net_(net), ctx_(ctx) {}

    // Loss of one row; writes dLoss/dOutput into grad when non-null.
    double rowLoss(const std::vector<double>& raw, double label, std::vector<double>* grad) const {
        if (isClassification(ctx_.problemType)) {
            std::vector<double> p = raw;
            MathUtils::softmaxInPlace(p);
            const size_t y = static_cast<size_t>(label);
            if (grad) {
                *grad = p;
                (*grad)[y] -= 1.0;
            }
            return -std::log(std::clamp(p[y], kProbabilityClip, 1.0));
        }
        const double target = (label - net_.targetMean) / net_.targetScale;
        if (ctx_.problemType == ProblemType::QUANTILE) {
            const size_t Q = ctx_.quantileLevels.size();
            double loss = 0.0;
            if (grad) grad->assign(Q, 0.0);
            for (size_t q = 0; q < Q; ++q) {
                const double tau = ctx_.quantileLevels[q];
                const double diff = target - raw[q];
                loss += diff >= 0.0 ? tau * diff : (tau - 1.0) * diff;
                if (grad) (*grad)[q] = (diff >= 0.0 ? -tau : 1.0 - tau) / static_cast<double>(Q);
            }
            return loss / static_cast<double>(Q);
        }
        const double diff = raw[0] - target;
        if (grad) *grad = {diff};
        return 0.5 * diff * diff;
    }

    double meanLoss(const FeatureMatrix& x, const std::vector<double>& y, const std::vector<size_t>& rows) const {
        double sum = 0.0;
        for (size_t r : rows) sum += rowLoss(net_.forward(x[r], nullptr), y[r], nullptr);
        return rows.empty() ? 0.0 : sum / static_cast<double>(rows.size());
    }

    void train(const FeatureMatrix& x,
               const std::vector<double>& y,
               const std::vector<double>& sampleWeights,
               const TrainingParams& params,
               std::mt19937& rng) {
        std::vector<size_t> order(x.size());
        std::iota(order.begin(), order.end(), 0);
        std::shuffle(order.begin(), order.end(), rng);

        size_t holdout = x.size() >= 20 ? std::max<size_t>(2, x.size() / 10) : 0;
        std::vector<size_t> valRows(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(holdout));
        std::vector<size_t> fitRows(order.begin() + static_cast<std::ptrdiff_t>(holdout), order.end());

        double bestVal = std::numeric_limits<double>::infinity();
        bool hasBest = false;
        int patience = 0;
        size_t step = 0;
        std::vector<std::vector<double>> bestW(net_.layers.size());
        std::vector<std::vector<double>> bestB(net_.layers.size());
        std::vector<std::vector<double>> activations(net_.layers.size());

        for (size_t epoch = 0; epoch < params.epochs; ++epoch) {
            ctx_.checkDeadline();
            std::shuffle(fitRows.begin(), fitRows.end(), rng);

            for (size_t start = 0; start < fitRows.size(); start += params.batch) {
                const size_t end = std::min(fitRows.size(), start + params.batch);
                for (auto& layer : net_.layers) {
                    std::fill(layer.gW.begin(), layer.gW.end(), 0.0);
                    std::fill(layer.gB.begin(), layer.gB.end(), 0.0);
                }
                double batchWeight = 0.0;
                for (size_t i = start; i < end; ++i) {
                    const size_t r = fitRows[i];
                    const double sw = sampleWeights.empty() ? 1.0 : sampleWeights[r];
                    if (sw <= 0.0) continue;
                    batchWeight += sw;
                    std::vector<double> delta;
                    rowLoss(net_.forward(x[r], &activations), y[r], &delta);
                    for (double& d : delta) d *= sw;
                    backpropagate(activations, delta);
                }
                if (batchWeight > 0.0) adamStep(params, batchWeight, ++step);
            }

            if (valRows.empty()) continue;
            const double valLoss = meanLoss(x, y, valRows);
            if (!std::isfinite(valLoss)) throw Strata::NumericalException("mlp: validation loss diverged");
            if (valLoss < bestVal - params.minDelta) {
                bestVal = valLoss;
                patience = 0;
                hasBest = true;
                for (size_t l = 0; l < net_.layers.size(); ++l) {
                    bestW[l] = net_.layers[l].w;
                    bestB[l] = net_.layers[l].b;
                }
            } else if (++patience >= params.patience) {
                break;
            }
        }

        if (hasBest) {
            for (size_t l = 0; l < net_.layers.size(); ++l) {
                net_.layers[l].w = bestW[l];
                net_.layers[l].b = bestB[l];
            }
        }
        for (auto& layer : net_.layers) layer.dropOptimizerState();
    }

private:
    void backpropagate(const std::vector<std::vector<double>>& activations, std::vector<double> delta) {
        for (size_t l = net_.layers.size(); l-- > 0;) {
            DenseLayer& layer = net_.layers[l];
            const std::vector<double>& input = activations[l];
            for (size_t o = 0; o < layer.out; ++o) {
                layer.gB[o] += delta[o];
                double* g = &layer.gW[o * layer.in];
                for (size_t i = 0; i < layer.in; ++i) g[i] += delta[o] * input[i];
            }
            if (l == 0) break;
            std::vector<double> prev(layer.in, 0.0);
            for (size_t o = 0; o < layer.out; ++o) {
                const double* row = &layer.w[o * layer.in];
                for (size_t i = 0; i < layer.in; ++i) prev[i] += row[i] * delta[o];
            }
            for (size_t i = 0; i < layer.in; ++i) prev[i] *= 1.0 - input[i] * input[i];
            delta = std::move(prev);
        }
    }

    void adamStep(const TrainingParams& params, double batchWeight, size_t step) {
        const double beta1t = 1.0 - std::pow(kBeta1, static_cast<double>(step));
        const double beta2t = 1.0 - std::pow(kBeta2, static_cast<double>(step));
        for (auto& layer : net_.layers) {
            for (size_t k = 0; k < layer.w.size(); ++k) {
                const double g = layer.gW[k] / batchWeight + params.l2 * layer.w[k];
                layer.mW[k] = kBeta1 * layer.mW[k] + (1.0 - kBeta1) * g;
                layer.vW[k] = kBeta2 * layer.vW[k] + (1.0 - kBeta2) * g * g;
                layer.w[k] -= params.lr * (layer.mW[k] / beta1t) / (std::sqrt(layer.vW[k] / beta2t) + kAdamEpsilon);
            }
            for (size_t k = 0; k < layer.b.size(); ++k) {
                const double g = layer.gB[k] / batchWeight;
                layer.mB[k] = kBeta1 * layer.mB[k] + (1.0 - kBeta1) * g;
                layer.vB[k] = kBeta2 * layer.vB[k] + (1.0 - kBeta2) * g * g;
                layer.b[k] -= params.lr * (layer.mB[k] / beta1t) / (std::sqrt(layer.vB[k] / beta2t) + kAdamEpsilon);
            }
        }
    }

    MlpArtifact& net_;
    const FitContext& ctx_;
};
} // namespace

FamilyCapabilities MlpFamily::capabilities() const {
    FamilyCapabilities caps;
    caps.problemTypes = {ProblemType::BINARY, ProblemType::MULTICLASS, ProblemType::REGRESSION, ProblemType::QUANTILE};
    caps.gpuCapable = true;
    return caps;
}

ResourceEstimate MlpFamily::estimate(const DatasetTraits& traits, const Hyperparameters& hp) const {
    const double hidden = std::max(1.0, hyperparameterOr(hp, "hidden", 32.0));
    const double layers = std::max(1.0, hyperparameterOr(hp, "layers", 1.0));
    const double epochs = std::max(1.0, hyperparameterOr(hp, "epochs", 60.0));
    const double outputs = static_cast<double>(std::max<size_t>(1, std::max(traits.classes, traits.quantiles)));
    const double params = static_cast<double>(traits.features) * hidden + (layers - 1.0) * hidden * hidden + hidden * outputs;
    ResourceEstimate est;
    est.fitSeconds = 5e-3 + static_cast<double>(traits.rows) * epochs * params * 6e-9;
    est.memoryBytes = static_cast<size_t>(params * sizeof(double) * 8 + static_cast<double>(traits.rows) * 16.0);
    est.gpus = static_cast<int>(hyperparameterOr(hp, "gpus", 0.0));
    return est;
}

FitOutput MlpFamily::fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const {
    FamilyUtils::requireTrainingRows(train, name());
    const size_t hidden = FamilyUtils::countParameter(hyperparameterOr(hp, "hidden", 32.0), kMaxHidden);
    const size_t depth = FamilyUtils::countParameter(hyperparameterOr(hp, "layers", 1.0), kMaxDepth);
    TrainingParams params;
    params.epochs = FamilyUtils::countParameter(hyperparameterOr(hp, "epochs", 60.0), kMaxEpochs);
    params.batch = FamilyUtils::countParameter(hyperparameterOr(hp, "batch", 32.0), train.rowCount());
    params.lr = hyperparameterOr(hp, "lr", 0.01);
    params.l2 = std::max(0.0, hyperparameterOr(hp, "l2", 1e-4));
    params.patience = static_cast<int>(FamilyUtils::countParameter(hyperparameterOr(hp, "patience", 8.0), kMaxEpochs));
    params.minDelta = std::max(0.0, hyperparameterOr(hp, "min_delta", 1e-4));
    if (!(params.lr > 0.0)) throw Strata::CandidateException("mlp: lr must be positive");

    auto artifact = std::make_unique<MlpArtifact>();
    artifact->problemType = ctx.problemType;
    artifact->scaler = MathUtils::fitStandardizer(train.features());
    if (!isClassification(ctx.problemType)) {
        double mean = 0.0;
        for (double v : train.labels()) mean += v;
        mean /= static_cast<double>(train.rowCount());
        double var = 0.0;
        for (double v : train.labels()) var += (v - mean) * (v - mean);
        const double sd = std::sqrt(var / static_cast<double>(train.rowCount()));
        artifact->targetMean = mean;
        artifact->targetScale = sd > 1e-12 ? sd : 1.0;
    }

    FeatureMatrix x;
    x.reserve(train.rowCount());
    for (const auto& row : train.features()) x.push_back(artifact->scaler.apply(row));

    std::mt19937 rng(ctx.seed);
    size_t width = train.featureCount();
    for (size_t l = 0; l < depth; ++l) {
        artifact->layers.emplace_back(width, hidden, rng);
        width = hidden;
    }
    const size_t outputs = isClassification(ctx.problemType) ? ctx.numClasses : ctx.width();
    artifact->layers.emplace_back(width, outputs, rng);

    MlpTrainer(*artifact, ctx).train(x, train.labels(), train.weights(), params, rng);

    FitOutput out;
    out.valPredictions.reserve(val.rowCount());
    for (const auto& row : val.features()) {
        out.valPredictions.push_back(artifact->finish(artifact->forward(artifact->scaler.apply(row), nullptr)));
    }
    FamilyUtils::requireFinite(out.valPredictions, name());
    out.artifact = std::move(artifact);
    return out;
}

PredictionMatrix MlpFamily::predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const {
    const auto& a = FamilyUtils::artifactAs<MlpArtifact>(artifact, name());
    PredictionMatrix out;
    out.reserve(rows.size());
    for (const auto& row : rows) out.push_back(a.finish(a.forward(a.scaler.apply(row), nullptr)));
    return out;
}
