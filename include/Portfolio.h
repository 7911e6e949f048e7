#pragma once
#include "ModelFamily.h"
#include "ResourceTracker.h"

#include <string>
#include <vector>

/**
 * One drawn portfolio entry. Immutable once built; the layer builder references it.
 */
struct CandidateConfig {
    std::string name;
    std::string family;
    Hyperparameters hyperparameters;
    ResourceEstimate estimate;
    size_t priority = 0;  // 0 = highest expected value
    bool requiresGpu = false;
    bool gpuShareable = false;
    bool requiresExternalWeights = false;
    std::string weightsId;
    bool allowInStackLayers = true;
};

struct PresetPolicy {
    std::string name;
    int rank = 0;  // total order over quality/speed
    size_t standardEntries = 0;
    bool includeExtreme = false;
    int maxLayers = 1;
    int folds = 5;
    int bagRepeats = 1;
};

/**
 * @brief Resolves preset names and aliases (medium, good, high, best, extreme).
 * @throws Strata::ConfigurationException for unknown presets.
 */
PresetPolicy parsePreset(const std::string& name);

struct PortfolioQuery {
    ProblemType problemType = ProblemType::REGRESSION;
    size_t rows = 0;
    size_t features = 0;
    size_t classes = 0;
    size_t quantiles = 0;
    std::string preset = "medium_quality";
    size_t extremeRowThreshold = 30000;
    std::vector<std::string> excludedFamilies;
};

struct PortfolioResult {
    PresetPolicy preset;
    std::vector<CandidateConfig> candidates;
    std::vector<std::string> notes;
    bool extremeGated = false;
};

class Portfolio {
public:
    struct Entry {
        std::string name;
        std::string family;
        Hyperparameters hyperparameters;
        bool extremeOnly = false;
        bool requiresGpu = false;
        bool gpuShareable = false;
        bool requiresExternalWeights = false;
        std::string weightsId;
        bool allowInStackLayers = true;
        size_t minRows = 0;
        size_t maxRows = 0;      // 0 = unbounded
        size_t maxFeatures = 0;  // 0 = unbounded
    };

    // Built-in ranked table, standard entries first.
    static const std::vector<Entry>& defaultEntries();

    /**
     * @brief Draws the ordered candidate list for a dataset and preset.
     * @post GPU-only entries are absent when snapshot.gpus == 0, with one note covering all of them.
     * @throws Strata::ConfigurationException for unknown presets.
     */
    static PortfolioResult build(const PortfolioQuery& query,
                                 const ResourceSnapshot& snapshot,
                                 const FamilyRegistry& registry,
                                 const std::vector<Entry>& entries = defaultEntries());
};
