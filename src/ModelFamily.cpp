#include "ModelFamily.h"
#include "BuiltinFamilies.h"
#include "StrataExceptions.h"

#include <algorithm>

double hyperparameterOr(const Hyperparameters& hp, const std::string& key, double fallback) {
    auto it = hp.find(key);
    return it == hp.end() ? fallback : it->second;
}

bool FamilyCapabilities::supports(ProblemType type) const {
    return std::find(problemTypes.begin(), problemTypes.end(), type) != problemTypes.end();
}

void FitContext::checkDeadline() const {
    if (Clock::now() > deadline) {
        throw Strata::TimeLimitExceeded(candidateName.empty() ? "candidate" : candidateName);
    }
}

void FamilyRegistry::registerFamily(const std::string& id, std::shared_ptr<const ModelFamily> family) {
    if (id.empty() || !family) {
        throw Strata::ConfigurationException("Family registration needs an id and an implementation");
    }
    families_[id] = std::move(family);
}

std::shared_ptr<const ModelFamily> FamilyRegistry::find(const std::string& id) const {
    auto it = families_.find(id);
    return it == families_.end() ? nullptr : it->second;
}

std::vector<std::string> FamilyRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(families_.size());
    for (const auto& kv : families_) out.push_back(kv.first);
    return out;
}

FamilyRegistry FamilyRegistry::builtin() {
    FamilyRegistry registry;
    registry.registerFamily("constant", std::make_shared<ConstantFamily>());
    registry.registerFamily("linear", std::make_shared<LinearFamily>());
    registry.registerFamily("tree", std::make_shared<TreeFamily>());
    registry.registerFamily("knn", std::make_shared<KnnFamily>());
    registry.registerFamily("mlp", std::make_shared<MlpFamily>());
    registry.registerFamily("incontext", std::make_shared<InContextFamily>());
    return registry;
}
