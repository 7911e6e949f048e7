#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct AutoConfig {
    std::string datasetPath;
    std::string labelColumn;
    std::string testPath;
    std::string predictionsOut;
    std::string leaderboardOut;
    std::string exportFormat = "csv";  // csv|parquet
    std::string oofOut;
    char delimiter = ',';
    std::string weightColumn;
    std::vector<std::string> excludedColumns;

    std::string problemType = "auto";  // auto|binary|multiclass|regression|quantile
    std::vector<double> quantileLevels = {0.1, 0.5, 0.9};
    std::string evalMetric = "auto";

    double timeLimit = 60.0;
    std::string preset = "medium_quality";
    int kfold = 0;      // 0 => preset default
    int bagSets = 0;    // 0 => preset default
    int maxLayers = 0;  // 0 => preset default
    bool stackUseOriginalFeatures = true;
    bool refitFull = false;

    // Scheduling
    double minModelCostSeconds = 0.05;
    double graceSeconds = 1.0;
    double maxTimeLimitRatio = 0.9;
    double maxTimeLimit = 0.0;  // 0 => no per-candidate cap

    // Ensemble selection
    int ensembleRounds = 25;
    double ensembleTolerance = 0.0;
    double ensembleTieEpsilon = 0.0;
    std::string ensembleTieBreak = "fit_time";  // fit_time|insertion

    size_t extremeRowThreshold = 30000;
    std::vector<std::string> excludedFamilies;

    // Resource overrides
    int numCpus = 0;    // 0 => detect
    int numGpus = -1;   // -1 => detect
    size_t gpuMemoryMb = 0;
    std::string weightsDir;

    bool pruneUnusedModels = true;
    size_t maxResidentModelMb = 0;  // 0 => unlimited
    uint32_t seed = 1337;
    bool verbose = true;

    /**
     * @brief Builds config from CLI args and optional config file.
     * @pre argv[1] is the training dataset path.
     * @post Returns a validated config object; CLI flags win over config file values.
     * @throws Strata::ConfigurationException on invalid arguments or values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults. Not validated.
     * @throws Strata::ConfigurationException on parse failures.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);

    /**
     * @brief Applies one normalized key (lower snake case) with its raw value.
     * @throws Strata::ConfigurationException for unknown keys or malformed values.
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Validates merged configuration invariants and enum-like fields.
     * @throws Strata::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage();
};
