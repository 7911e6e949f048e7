#pragma once
#include "FoldAssignment.h"
#include "Metrics.h"
#include "ModelRegistry.h"
#include "Portfolio.h"
#include "ResourceTracker.h"
#include "WeightsProvider.h"

#include <string>
#include <vector>

struct CandidateFailure {
    enum class Kind { FIT_ERROR, NUMERICAL, OUT_OF_MEMORY, MISSING_DEPENDENCY, UNKNOWN_FAMILY, TIME_LIMIT, BUDGET_SKIPPED };

    std::string candidate;
    size_t layer = 0;
    Kind kind = Kind::FIT_ERROR;
    std::string reason;
};

std::string failureKindName(CandidateFailure::Kind kind);

struct LayerOutput {
    size_t layer = 0;
    std::vector<size_t> models;  // arena indices, portfolio order
    std::vector<CandidateFailure> failures;
    bool budgetExhausted = false;
};

struct LayerSettings {
    int folds = 5;
    int repeats = 1;
    bool useOriginalFeatures = true;
    bool refitFull = false;
    double minModelCostSeconds = 0.05;
    double graceSeconds = 1.0;
    double maxTimeLimitRatio = 0.9;
    double maxTimeLimit = 0.0;  // 0 = no cap
    bool verbose = true;
};

/**
 * Trains one stack layer: every admitted candidate runs its full repeated k-fold on the
 * shared fold assignment, producing fold artifacts and an OOF matrix. Candidates run in
 * parallel; results are committed to the registry serially in portfolio order.
 */
class StackLayerBuilder {
public:
    StackLayerBuilder(const FamilyRegistry& families,
                      const WeightsProvider* weights,
                      const ResourceTracker& tracker,
                      GpuSlotPool& gpus,
                      const EvalMetric& metric,
                      LayerSettings settings);

    /**
     * @brief Fits one layer.
     * @param layer 0-based layer index.
     * @param base encoded training rows with the original features only.
     * @param previous arena indices of the previous layer's models (empty for layer 0).
     * @param prototype problem description and seed shared by every candidate.
     * @post Candidate-local failures are returned in the output, never thrown.
     */
    LayerOutput build(size_t layer,
                      const Dataset& base,
                      const FoldAssignment& folds,
                      const std::vector<CandidateConfig>& candidates,
                      const std::vector<size_t>& previous,
                      ModelRegistry& registry,
                      const FitContext& prototype) const;

    /**
     * @brief Input rows of a stacked model: the original features (when kept) followed by
     *        every input block's columns, in order.
     * @throws Strata::DatasetException when an input block has a different row count.
     */
    static FeatureMatrix stackRows(const FeatureMatrix& original,
                                   const std::vector<const PredictionMatrix*>& inputs,
                                   bool keepOriginal);

    static std::vector<std::string> stackedNames(const std::vector<std::string>& original,
                                                 const std::vector<std::string>& inputModelNames,
                                                 size_t width,
                                                 bool keepOriginal);

    // <name>_BAG_L<layer+1>
    static std::string modelName(const std::string& candidate, size_t layer);

private:
    struct TaskResult;

    TaskResult trainCandidate(const CandidateConfig& config,
                              size_t layer,
                              const Dataset& data,
                              const FoldAssignment& folds,
                              const std::vector<size_t>& inputs,
                              const FitContext& prototype,
                              int threads) const;

    Clock::time_point candidateDeadline() const;

    const FamilyRegistry& families_;
    const WeightsProvider* weights_;
    const ResourceTracker& tracker_;
    GpuSlotPool& gpus_;
    const EvalMetric& metric_;
    LayerSettings settings_;
};
