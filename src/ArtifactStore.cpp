#include "ArtifactStore.h"
#include "StrataExceptions.h"

ArtifactRef InMemoryArtifactStore::put(std::shared_ptr<const FittedModel> model) {
    if (!model) throw Strata::IOException("Cannot store an empty model");
    std::lock_guard<std::mutex> lock(mutex_);
    ArtifactRef ref{model->name + "#" + std::to_string(nextId_++)};
    models_[ref.key] = std::move(model);
    return ref;
}

std::shared_ptr<const FittedModel> InMemoryArtifactStore::get(const ArtifactRef& ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = models_.find(ref.key);
    if (it == models_.end()) throw Strata::IOException("Unknown artifact reference '" + ref.key + "'");
    return it->second;
}

size_t InMemoryArtifactStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return models_.size();
}
