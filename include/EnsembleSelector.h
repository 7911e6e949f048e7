#pragma once
#include "Dataset.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

enum class TieBreak { FIT_TIME, INSERTION };

/**
 * @throws Strata::ConfigurationException for names other than fit_time / insertion.
 */
TieBreak parseTieBreak(const std::string& name);

struct SelectorConfig {
    int rounds = 25;
    double tolerance = 0.0;    // minimum loss improvement to keep adding
    double tieEpsilon = 0.0;   // losses within this band count as tied
    TieBreak tieBreak = TieBreak::FIT_TIME;
};

struct SelectorCandidate {
    size_t modelIndex = 0;
    const PredictionMatrix* oof = nullptr;
    double fitSeconds = 0.0;
    size_t insertionOrder = 0;
};

struct EnsembleWeights {
    // (model index, weight), ascending model index; weights are non-negative and sum to 1.
    std::vector<std::pair<size_t, double>> weights;
    double validationLoss = 0.0;
    int roundsUsed = 0;
    std::vector<size_t> trace;  // model index picked in each round

    double weightOf(size_t modelIndex) const;
    std::vector<size_t> support() const;
};

/**
 * Greedy forward selection with replacement. Each round scores every candidate added to
 * the current multiset (parallel map), then picks the lowest loss serially with the
 * configured tie-break, so the result does not depend on thread count.
 */
class EnsembleSelector {
public:
    // Lower is better. Must be safe to call concurrently.
    using LossFn = std::function<double(const PredictionMatrix&)>;

    EnsembleSelector(SelectorConfig config, LossFn loss);

    /**
     * @brief Selects weights over the candidates' OOF predictions.
     * @pre every candidate has an OOF matrix of identical shape.
     * @throws Strata::StrataException on empty input or shape mismatch.
     * @throws Strata::NumericalException when no candidate yields a finite loss.
     */
    EnsembleWeights select(const std::vector<SelectorCandidate>& candidates) const;

    // Weighted mean of the given prediction blocks.
    static PredictionMatrix blend(const std::vector<std::pair<const PredictionMatrix*, double>>& parts);

private:
    SelectorConfig config_;
    LossFn loss_;
};
