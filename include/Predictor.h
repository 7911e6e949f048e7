#pragma once
#include "Dataset.h"
#include "EnsembleSelector.h"
#include "ModelRegistry.h"
#include "ResourceTracker.h"
#include "StackLayerBuilder.h"

#include <memory>
#include <string>
#include <vector>

struct FitSummary {
    ProblemType problemType = ProblemType::REGRESSION;
    std::string metricName;
    bool higherIsBetter = false;
    std::string preset;
    size_t trainRows = 0;
    size_t features = 0;
    size_t numClasses = 0;
    std::vector<double> quantileLevels;
    int folds = 0;
    int repeats = 0;
    size_t layersBuilt = 0;
    size_t finalLayer = 0;
    double ensembleScore = 0.0;  // metric value of the ensemble's OOF predictions
    double budgetSeconds = 0.0;
    double elapsedSeconds = 0.0;
    ResourceSnapshot resources;
    std::vector<std::string> notes;
    std::vector<CandidateFailure> failures;
    size_t modelsFitted = 0;
    size_t modelsPruned = 0;
    size_t modelsDemoted = 0;
    std::string haltReason;
};

/**
 * Inference handle returned by TrainingEngine::fit(). Evaluates the ensemble's dependency
 * closure layer by layer and blends the final layer with the ensemble weights.
 */
class Predictor {
public:
    Predictor(std::shared_ptr<ModelRegistry> registry,
              DatasetEncoder encoder,
              EnsembleWeights weights,
              PredictionMatrix ensembleOof,
              FitSummary summary);

    /**
     * @brief Ensemble predictions in the problem type's output layout.
     * @throws Strata::DatasetException when a training feature column is missing.
     */
    PredictionMatrix predict(const TabularData& data) const;

    // Same as predict() for rows already encoded with this predictor's encoder.
    PredictionMatrix predictEncoded(const FeatureMatrix& rows) const;

    /**
     * @brief Class labels for classification; the point estimate (median for quantile) otherwise.
     */
    std::vector<std::string> predictLabels(const TabularData& data) const;

    /**
     * @brief One column per class, in classLabels() order (binary expands to two columns).
     * @throws Strata::ConfigurationException for non-classification problems.
     */
    PredictionMatrix predictProba(const TabularData& data) const;

    /**
     * @brief One column per quantileLevels() entry; every row is non-decreasing.
     * @throws Strata::ConfigurationException for non-quantile problems.
     */
    PredictionMatrix predictQuantiles(const TabularData& data) const;

    const Leaderboard& leaderboard() const noexcept { return registry_->leaderboard(); }
    const ModelRegistry& registry() const noexcept { return *registry_; }
    const EnsembleWeights& ensembleWeights() const noexcept { return weights_; }
    const PredictionMatrix& ensembleOof() const noexcept { return ensembleOof_; }
    const FitSummary& summary() const noexcept { return summary_; }
    const std::vector<std::string>& classLabels() const noexcept { return encoder_.classLabels(); }
    const std::vector<double>& quantileLevels() const noexcept { return summary_.quantileLevels; }
    const std::vector<size_t>& evaluationOrder() const noexcept { return evaluationOrder_; }

private:
    std::shared_ptr<ModelRegistry> registry_;
    DatasetEncoder encoder_;
    EnsembleWeights weights_;
    PredictionMatrix ensembleOof_;
    FitSummary summary_;
    std::vector<size_t> evaluationOrder_;
};
