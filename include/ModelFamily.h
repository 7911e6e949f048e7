#pragma once
#include "Dataset.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

using Hyperparameters = std::map<std::string, double>;

double hyperparameterOr(const Hyperparameters& hp, const std::string& key, double fallback);

struct DatasetTraits {
    size_t rows = 0;
    size_t features = 0;
    size_t classes = 0;
    size_t quantiles = 0;
    ProblemType problemType = ProblemType::REGRESSION;
};

struct ResourceEstimate {
    double fitSeconds = 0.0;  // one fold fit
    size_t memoryBytes = 0;
    int gpus = 0;
};

struct FamilyCapabilities {
    std::vector<ProblemType> problemTypes;
    bool gpuCapable = false;
    bool gpuShareable = false;

    bool supports(ProblemType type) const;
};

// Opaque trained state. Only the family that produced an artifact interprets it.
class ModelArtifact {
public:
    virtual ~ModelArtifact() = default;
    virtual size_t memoryBytes() const = 0;
};

using Clock = std::chrono::steady_clock;

/**
 * Per-task environment handed to a family's fit(). Families poll checkDeadline()
 * between units of work (epochs, tree nodes, neighbour blocks).
 */
struct FitContext {
    ProblemType problemType = ProblemType::REGRESSION;
    size_t numClasses = 0;
    std::vector<double> quantileLevels;
    Clock::time_point deadline = Clock::time_point::max();
    int numThreads = 1;
    uint32_t seed = 1337;
    std::string weightsPath;
    std::string candidateName;

    size_t width() const noexcept { return outputWidth(problemType, numClasses, quantileLevels.size()); }

    /**
     * @throws Strata::TimeLimitExceeded once the deadline (grace included) has passed.
     */
    void checkDeadline() const;
};

struct FitOutput {
    std::unique_ptr<ModelArtifact> artifact;
    PredictionMatrix valPredictions;
};

/**
 * Opaque fit/predict unit. Implementations must be stateless after construction so one
 * instance can serve concurrent fits.
 */
class ModelFamily {
public:
    virtual ~ModelFamily() = default;

    virtual std::string name() const = 0;
    virtual FamilyCapabilities capabilities() const = 0;
    virtual ResourceEstimate estimate(const DatasetTraits& traits, const Hyperparameters& hp) const = 0;

    /**
     * @brief Trains on train and predicts val (which may have zero rows).
     * @throws Strata::CandidateException (or subclasses) on candidate-local failure.
     */
    virtual FitOutput fit(const Dataset& train,
                          const Dataset& val,
                          const Hyperparameters& hp,
                          const FitContext& ctx) const = 0;

    /**
     * @brief Predicts rows with an artifact previously returned by this family's fit().
     * @throws Strata::CandidateException when the artifact belongs to another family.
     */
    virtual PredictionMatrix predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const = 0;
};

class FamilyRegistry {
public:
    void registerFamily(const std::string& id, std::shared_ptr<const ModelFamily> family);
    std::shared_ptr<const ModelFamily> find(const std::string& id) const;
    bool contains(const std::string& id) const { return families_.count(id) > 0; }
    std::vector<std::string> ids() const;

    // constant, linear, tree, knn, mlp, incontext
    static FamilyRegistry builtin();

private:
    std::map<std::string, std::shared_ptr<const ModelFamily>> families_;
};
