#pragma once
#include "ArtifactStore.h"
#include "FittedModel.h"
#include "Leaderboard.h"

#include <memory>
#include <vector>

/**
 * Arena of fitted models (index -> model, layer -> indices) plus the leaderboard that
 * observes every add(). Only the layer builder's accumulation step writes to it.
 */
class ModelRegistry {
public:
    ModelRegistry(Leaderboard leaderboard, std::shared_ptr<ArtifactStore> store);

    /**
     * @brief Appends a model and its leaderboard entry.
     * @return the model's arena index.
     */
    size_t add(std::shared_ptr<const FittedModel> model);

    /**
     * @brief Returns a model, reloading it from the artifact store when demoted.
     * @throws Strata::StrataException when the index is unknown or the model was pruned.
     */
    std::shared_ptr<const FittedModel> get(size_t index) const;

    size_t size() const noexcept { return slots_.size(); }
    size_t layerCount() const noexcept { return layers_.size(); }
    const std::vector<size_t>& layerModels(size_t layer) const;
    size_t layerOf(size_t index) const;
    const std::vector<size_t>& inputsOf(size_t index) const;
    bool isResident(size_t index) const;
    bool isReleased(size_t index) const;
    const Leaderboard& leaderboard() const noexcept { return leaderboard_; }

    /**
     * @brief Minimal closure of models needed to evaluate the support set: the support plus,
     *        transitively, every model whose OOF columns feed them.
     * @post Ordered by layer, then arena index, i.e. a valid evaluation order.
     */
    std::vector<size_t> resolveDependencies(const std::vector<size_t>& support) const;

    // Releases every model not in keep. Returns the number released.
    size_t prune(const std::vector<size_t>& keep);

    /**
     * @brief Demotes resident models (lowest index first, never pinned) to the artifact store
     *        until the resident estimate is at most limitBytes. 0 disables the limit.
     * @return number of models demoted.
     */
    size_t enforceMemoryLimit(size_t limitBytes, const std::vector<size_t>& pinned);

    size_t residentBytes() const;

private:
    struct Slot {
        std::shared_ptr<const FittedModel> resident;
        ArtifactRef ref;
        size_t layer = 0;
        std::vector<size_t> inputs;
        size_t memoryBytes = 0;
        bool released = false;
    };

    const Slot& slot(size_t index) const;

    Leaderboard leaderboard_;
    std::shared_ptr<ArtifactStore> store_;
    std::vector<Slot> slots_;
    std::vector<std::vector<size_t>> layers_;
};
