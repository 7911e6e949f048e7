#pragma once
#include "ArtifactStore.h"
#include "AutoConfig.h"
#include "ModelFamily.h"
#include "Portfolio.h"
#include "Predictor.h"
#include "ResourceTracker.h"
#include "TabularData.h"
#include "WeightsProvider.h"

#include <memory>
#include <string>
#include <vector>

/**
 * Training entry point. One fit() runs the whole pipeline: validation, encoding, resource
 * probe, portfolio draw, stack layers, ensemble selection and registry pruning.
 */
class TrainingEngine {
public:
    explicit TrainingEngine(AutoConfig config,
                            FamilyRegistry families = FamilyRegistry::builtin(),
                            std::shared_ptr<const WeightsProvider> weights = nullptr,
                            std::shared_ptr<ArtifactStore> store = nullptr);

    // Filesystem root and environment used for resource detection.
    void setResourceProbe(ResourceProbe probe) { probe_ = std::move(probe); }
    void setPortfolioEntries(std::vector<Portfolio::Entry> entries) { entries_ = std::move(entries); }

    /**
     * @brief Trains the stacked ensemble.
     * @throws Strata::ConfigurationException / Strata::DatasetException on fatal input errors,
     *         raised before any model is trained.
     * @throws Strata::FitFailedException when no layer produced a model; what() lists every failure.
     */
    Predictor fit(const TabularData& data) const;

    const AutoConfig& config() const noexcept { return config_; }

    // Problem type from the config hint, or inferred from the label column when "auto".
    static ProblemType resolveProblemType(const std::string& hint, const TypedColumn& label);

    // User quantile levels plus 0.5, ascending and de-duplicated.
    static std::vector<double> modelQuantileLevels(const std::vector<double>& userLevels);

    static std::string failureReport(const std::vector<CandidateFailure>& failures);

private:
    AutoConfig config_;
    FamilyRegistry families_;
    std::shared_ptr<const WeightsProvider> weights_;
    std::shared_ptr<ArtifactStore> store_;
    ResourceProbe probe_;
    std::vector<Portfolio::Entry> entries_;
};
