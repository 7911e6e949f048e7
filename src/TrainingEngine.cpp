#include "TrainingEngine.h"
#include "CommonUtils.h"
#include "EnsembleSelector.h"
#include "FoldAssignment.h"
#include "Metrics.h"
#include "StackLayerBuilder.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
EnsembleWeights selectForLayer(const ModelRegistry& registry,
                               const std::vector<size_t>& models,
                               const EnsembleSelector& selector) {
    std::vector<std::shared_ptr<const FittedModel>> held;
    std::vector<SelectorCandidate> candidates;
    held.reserve(models.size());
    for (size_t idx : models) {
        held.push_back(registry.get(idx));
        SelectorCandidate c;
        c.modelIndex = idx;
        c.oof = &held.back()->oof;
        c.fitSeconds = held.back()->fitSeconds;
        c.insertionOrder = idx;
        candidates.push_back(c);
    }
    return selector.select(candidates);
}

PredictionMatrix blendOof(const ModelRegistry& registry, const EnsembleWeights& weights) {
    std::vector<std::shared_ptr<const FittedModel>> held;
    std::vector<std::pair<const PredictionMatrix*, double>> parts;
    held.reserve(weights.weights.size());
    for (const auto& w : weights.weights) {
        held.push_back(registry.get(w.first));
        parts.emplace_back(&held.back()->oof, w.second);
    }
    return EnsembleSelector::blend(parts);
}
} // namespace

TrainingEngine::TrainingEngine(AutoConfig config,
                               FamilyRegistry families,
                               std::shared_ptr<const WeightsProvider> weights,
                               std::shared_ptr<ArtifactStore> store)
    : config_(std::move(config)),
      families_(std::move(families)),
      weights_(std::move(weights)),
      store_(std::move(store)),
      entries_(Portfolio::defaultEntries()) {
    if (!weights_ && !config_.weightsDir.empty()) {
        weights_ = std::make_shared<DirectoryWeightsProvider>(config_.weightsDir);
    }
    if (!store_) store_ = std::make_shared<InMemoryArtifactStore>();
}

ProblemType TrainingEngine::resolveProblemType(const std::string& hint, const TypedColumn& label) {
    const std::string h = CommonUtils::toLower(CommonUtils::trim(hint));
    if (h.empty() || h == "auto") {
        return DatasetEncoder::inferProblemType(label);
    }
    if (h == "binary") return ProblemType::BINARY;
    if (h == "multiclass") return ProblemType::MULTICLASS;
    if (h == "regression") return ProblemType::REGRESSION;
    if (h == "quantile") return ProblemType::QUANTILE;
    throw Strata::ConfigurationException("Invalid problem_type: " + hint);
}

std::vector<double> TrainingEngine::modelQuantileLevels(const std::vector<double>& userLevels) {
    std::vector<double> levels = userLevels;
    levels.push_back(0.5);
    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());
    return levels;
}

std::string TrainingEngine::failureReport(const std::vector<CandidateFailure>& failures) {
    std::ostringstream os;
    os << "no model could be fitted in any layer";
    if (failures.empty()) {
        os << " (no candidate was admitted)";
        return os.str();
    }
    os << "; " << failures.size() << " candidate failure(s):";
    for (const auto& f : failures) {
        os << "\n  - " << StackLayerBuilder::modelName(f.candidate, f.layer)
           << " [" << failureKindName(f.kind) << "] " << f.reason;
    }
    return os.str();
}

Predictor TrainingEngine::fit(const TabularData& data) const {
    // Fatal checks first; nothing below allocates models until they pass.
    config_.validate();
    if (data.rowCount() == 0 || data.colCount() == 0) {
        throw Strata::DatasetException("Training data is empty");
    }
    const int labelIdx = data.findColumnIndex(config_.labelColumn);
    if (labelIdx < 0) {
        throw Strata::ConfigurationException("Label column '" + config_.labelColumn + "' not found in training data");
    }
    const TypedColumn& labelColumn = data.columns()[static_cast<size_t>(labelIdx)];
    const ProblemType problemType = resolveProblemType(config_.problemType, labelColumn);
    const std::vector<double> quantileLevels = problemType == ProblemType::QUANTILE
        ? modelQuantileLevels(config_.quantileLevels)
        : std::vector<double>{};

    DatasetEncoder encoder;
    encoder.fit(data, config_.labelColumn, problemType, config_.weightColumn, config_.excludedColumns);
    const Dataset train = encoder.transform(data, true);
    if (train.rowCount() < 2) {
        throw Strata::DatasetException("At least two labelled rows are required, got " + std::to_string(train.rowCount()));
    }
    const EvalMetric metric = Metrics::byName(config_.evalMetric, problemType, quantileLevels);
    const PresetPolicy policy = parsePreset(config_.preset);
    const TieBreak tieBreak = parseTieBreak(config_.ensembleTieBreak);

    ResourceOverrides overrides;
    overrides.numCpus = config_.numCpus;
    overrides.numGpus = config_.numGpus;
    overrides.gpuMemoryMb = config_.gpuMemoryMb;
    const ResourceSnapshot snapshot = probe_.probe(overrides);
    const ResourceTracker tracker(config_.timeLimit, snapshot);

    if (config_.verbose) {
        std::cout << "[Strata] " << problemTypeName(problemType) << " problem on " << train.rowCount() << " rows x "
                  << train.featureCount() << " features, metric=" << metric.name << ", preset=" << policy.name
                  << ", budget=" << CommonUtils::formatSeconds(config_.timeLimit) << "\n";
        std::cout << "[Strata][Resources] cpus=" << snapshot.cpus << " gpus=" << snapshot.gpus;
        if (snapshot.memoryBytes > 0) std::cout << " memory=" << (snapshot.memoryBytes >> 20) << "MB";
        std::cout << "\n";
    }

    const int folds = config_.kfold > 0 ? config_.kfold : policy.folds;
    const int repeats = config_.bagSets > 0 ? config_.bagSets : policy.bagRepeats;
    const int maxLayers = config_.maxLayers > 0 ? config_.maxLayers : policy.maxLayers;

    PortfolioQuery query;
    query.problemType = problemType;
    query.rows = train.rowCount();
    query.features = train.featureCount();
    query.classes = encoder.numClasses();
    query.quantiles = quantileLevels.size();
    query.preset = policy.name;
    query.extremeRowThreshold = config_.extremeRowThreshold;
    query.excludedFamilies = config_.excludedFamilies;
    const PortfolioResult portfolio = Portfolio::build(query, snapshot, families_, entries_);
    for (const auto& note : portfolio.notes) {
        std::cout << "[Strata][Portfolio] " << note << "\n";
    }

    const FoldAssignment foldAssignment = FoldAssignment::make(
        train.labels(), folds, repeats, isClassification(problemType), config_.seed);

    auto registry = std::make_shared<ModelRegistry>(Leaderboard(metric.name, metric.higherIsBetter), store_);
    GpuSlotPool gpus(snapshot.gpus);

    LayerSettings settings;
    settings.folds = foldAssignment.folds();
    settings.repeats = foldAssignment.repeats();
    settings.useOriginalFeatures = config_.stackUseOriginalFeatures;
    settings.refitFull = config_.refitFull;
    settings.minModelCostSeconds = config_.minModelCostSeconds;
    settings.graceSeconds = config_.graceSeconds;
    settings.maxTimeLimitRatio = config_.maxTimeLimitRatio;
    settings.maxTimeLimit = config_.maxTimeLimit;
    settings.verbose = config_.verbose;
    const StackLayerBuilder builder(families_, weights_.get(), tracker, gpus, metric, settings);

    FitContext prototype;
    prototype.problemType = problemType;
    prototype.numClasses = encoder.numClasses();
    prototype.quantileLevels = quantileLevels;
    prototype.seed = config_.seed;

    SelectorConfig selectorConfig;
    selectorConfig.rounds = config_.ensembleRounds;
    selectorConfig.tolerance = config_.ensembleTolerance;
    selectorConfig.tieEpsilon = config_.ensembleTieEpsilon;
    selectorConfig.tieBreak = tieBreak;
    const EnsembleSelector selector(selectorConfig, [&metric, &train](const PredictionMatrix& p) {
        return metric.toLoss(metric.compute(train.labels(), p, train.weights()));
    });

    FitSummary summary;
    std::vector<size_t> previous;
    EnsembleWeights finalWeights;
    bool haveFinal = false;
    double previousBestLoss = 0.0;

    for (int layer = 0; layer < maxLayers; ++layer) {
        const size_t L = static_cast<size_t>(layer);
        if (layer > 0 && tracker.remainingTime() < config_.minModelCostSeconds) {
            summary.haltReason = "budget exhausted before layer " + std::to_string(layer + 1);
            break;
        }

        LayerOutput out = builder.build(L, train, foldAssignment, portfolio.candidates, previous, *registry, prototype);
        summary.failures.insert(summary.failures.end(), out.failures.begin(), out.failures.end());
        summary.layersBuilt = L + 1;
        if (out.models.empty()) {
            summary.haltReason = "layer " + std::to_string(layer + 1) + " produced no models";
            std::cerr << "[Strata][Warning] Layer " << (layer + 1) << " produced no models";
            if (haveFinal) std::cerr << "; keeping layer " << (summary.finalLayer + 1);
            std::cerr << "\n";
            break;
        }

        EnsembleWeights weights = selectForLayer(*registry, out.models, selector);
        double bestSingleLoss = 0.0;
        for (size_t i = 0; i < out.models.size(); ++i) {
            const double loss = metric.toLoss(registry->get(out.models[i])->validationScore);
            if (i == 0 || loss < bestSingleLoss) bestSingleLoss = loss;
        }
        if (config_.verbose) {
            std::cout << "[Strata][Ensemble] Layer " << (layer + 1) << " ensemble loss=" << std::setprecision(6)
                      << weights.validationLoss << " best single loss=" << bestSingleLoss << "\n";
        }

        if (haveFinal && (bestSingleLoss > previousBestLoss || weights.validationLoss > finalWeights.validationLoss)) {
            summary.haltReason = "layer " + std::to_string(layer + 1) + " did not improve on layer " + std::to_string(layer);
            if (config_.verbose) {
                std::cout << "[Strata][Ensemble] Stacking halted: " << summary.haltReason << "\n";
            }
            break;
        }

        finalWeights = std::move(weights);
        summary.finalLayer = L;
        previousBestLoss = bestSingleLoss;
        previous = out.models;
        haveFinal = true;

        if (out.budgetExhausted) {
            summary.haltReason = "budget exhausted during layer " + std::to_string(layer + 1);
            break;
        }
    }

    if (!haveFinal) {
        throw Strata::FitFailedException(failureReport(summary.failures));
    }

    PredictionMatrix ensembleOof = blendOof(*registry, finalWeights);
    summary.ensembleScore = metric.compute(train.labels(), ensembleOof, train.weights());
    summary.modelsFitted = registry->size();

    const std::vector<size_t> support = finalWeights.support();
    if (config_.pruneUnusedModels) {
        summary.modelsPruned = registry->prune(registry->resolveDependencies(support));
    }
    if (config_.maxResidentModelMb > 0) {
        summary.modelsDemoted = registry->enforceMemoryLimit(config_.maxResidentModelMb * 1024 * 1024, support);
    }

    summary.problemType = problemType;
    summary.metricName = metric.name;
    summary.higherIsBetter = metric.higherIsBetter;
    summary.preset = policy.name;
    summary.trainRows = train.rowCount();
    summary.features = train.featureCount();
    summary.numClasses = encoder.numClasses();
    summary.quantileLevels = quantileLevels;
    summary.folds = foldAssignment.folds();
    summary.repeats = foldAssignment.repeats();
    summary.budgetSeconds = config_.timeLimit;
    summary.elapsedSeconds = tracker.elapsed();
    summary.resources = snapshot;
    summary.notes = portfolio.notes;

    if (config_.verbose) {
        std::cout << "[Strata][Ensemble] Final layer " << (summary.finalLayer + 1) << ", "
                  << support.size() << " model(s) in the ensemble, " << metric.name << "="
                  << std::setprecision(6) << summary.ensembleScore << "\n";
        std::cout << "[Strata] Fit complete in " << CommonUtils::formatSeconds(summary.elapsedSeconds) << " ("
                  << summary.modelsFitted << " fitted, " << summary.modelsPruned << " pruned)\n";
    }

    return Predictor(registry, std::move(encoder), std::move(finalWeights), std::move(ensembleOof), std::move(summary));
}
