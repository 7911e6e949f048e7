#include "ModelRegistry.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <unordered_set>

ModelRegistry::ModelRegistry(Leaderboard leaderboard, std::shared_ptr<ArtifactStore> store)
    : leaderboard_(std::move(leaderboard)), store_(std::move(store)) {}

size_t ModelRegistry::add(std::shared_ptr<const FittedModel> model) {
    if (!model) throw Strata::StrataException("Cannot register an empty model");
    const size_t index = slots_.size();
    for (size_t in : model->inputModels) {
        if (in >= index) throw Strata::StrataException(model->name + " depends on an unregistered model");
    }

    LeaderboardEntry entry;
    entry.modelIndex = index;
    entry.modelName = model->name;
    entry.family = model->config.family;
    entry.validationScore = model->validationScore;
    entry.fitSeconds = model->fitSeconds;
    entry.predictSeconds = model->predictSeconds;
    entry.memoryBytes = model->memoryBytes;
    entry.layer = model->layer;

    Slot s;
    s.layer = model->layer;
    s.inputs = model->inputModels;
    s.memoryBytes = model->memoryBytes;
    s.resident = std::move(model);
    slots_.push_back(std::move(s));

    if (layers_.size() <= entry.layer) layers_.resize(entry.layer + 1);
    layers_[entry.layer].push_back(index);
    leaderboard_.append(std::move(entry));
    return index;
}

const ModelRegistry::Slot& ModelRegistry::slot(size_t index) const {
    if (index >= slots_.size()) {
        throw Strata::StrataException("Unknown model index " + std::to_string(index));
    }
    return slots_[index];
}

std::shared_ptr<const FittedModel> ModelRegistry::get(size_t index) const {
    const Slot& s = slot(index);
    if (s.released) throw Strata::StrataException("Model index " + std::to_string(index) + " was pruned");
    if (s.resident) return s.resident;
    if (!store_ || !s.ref.valid()) {
        throw Strata::StrataException("Model index " + std::to_string(index) + " is not resident and has no stored artifact");
    }
    return store_->get(s.ref);
}

const std::vector<size_t>& ModelRegistry::layerModels(size_t layer) const {
    static const std::vector<size_t> empty;
    return layer < layers_.size() ? layers_[layer] : empty;
}

size_t ModelRegistry::layerOf(size_t index) const {
    return slot(index).layer;
}

const std::vector<size_t>& ModelRegistry::inputsOf(size_t index) const {
    return slot(index).inputs;
}

bool ModelRegistry::isResident(size_t index) const {
    return static_cast<bool>(slot(index).resident);
}

bool ModelRegistry::isReleased(size_t index) const {
    return slot(index).released;
}

std::vector<size_t> ModelRegistry::resolveDependencies(const std::vector<size_t>& support) const {
    std::unordered_set<size_t> visited;
    std::vector<size_t> stack(support.begin(), support.end());
    while (!stack.empty()) {
        const size_t idx = stack.back();
        stack.pop_back();
        if (!visited.insert(idx).second) continue;
        for (size_t in : slot(idx).inputs) {
            if (!visited.count(in)) stack.push_back(in);
        }
    }

    std::vector<size_t> out(visited.begin(), visited.end());
    std::sort(out.begin(), out.end(), [this](size_t a, size_t b) {
        if (slots_[a].layer != slots_[b].layer) return slots_[a].layer < slots_[b].layer;
        return a < b;
    });
    return out;
}

size_t ModelRegistry::prune(const std::vector<size_t>& keep) {
    const std::unordered_set<size_t> kept(keep.begin(), keep.end());
    size_t released = 0;
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (kept.count(i) || slots_[i].released) continue;
        slots_[i].resident.reset();
        slots_[i].released = true;
        ++released;
    }
    return released;
}

size_t ModelRegistry::residentBytes() const {
    size_t total = 0;
    for (const auto& s : slots_) {
        if (s.resident) total += s.memoryBytes;
    }
    return total;
}

size_t ModelRegistry::enforceMemoryLimit(size_t limitBytes, const std::vector<size_t>& pinned) {
    if (limitBytes == 0 || !store_) return 0;
    const std::unordered_set<size_t> pin(pinned.begin(), pinned.end());
    size_t resident = residentBytes();
    size_t demoted = 0;
    for (size_t i = 0; i < slots_.size() && resident > limitBytes; ++i) {
        Slot& s = slots_[i];
        if (!s.resident || pin.count(i)) continue;
        s.ref = store_->put(s.resident);
        s.resident.reset();
        resident -= std::min(resident, s.memoryBytes);
        ++demoted;
    }
    return demoted;
}
