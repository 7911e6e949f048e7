#pragma once
#include "FittedModel.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

struct ArtifactRef {
    std::string key;
    bool valid() const noexcept { return !key.empty(); }
};

// Persistence collaborator. On-disk formats are the implementation's business.
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;
    virtual ArtifactRef put(std::shared_ptr<const FittedModel> model) = 0;

    /**
     * @throws Strata::IOException when the reference is unknown.
     */
    virtual std::shared_ptr<const FittedModel> get(const ArtifactRef& ref) const = 0;
};

class InMemoryArtifactStore : public ArtifactStore {
public:
    ArtifactRef put(std::shared_ptr<const FittedModel> model) override;
    std::shared_ptr<const FittedModel> get(const ArtifactRef& ref) const override;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const FittedModel>> models_;
    size_t nextId_ = 0;
};
