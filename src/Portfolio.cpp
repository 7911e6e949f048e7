#include "Portfolio.h"
#include "CommonUtils.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <limits>
#include <unordered_set>

namespace {
constexpr size_t kAllEntries = std::numeric_limits<size_t>::max();

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}
} // namespace

PresetPolicy parsePreset(const std::string& rawName) {
    std::string name = CommonUtils::toLower(CommonUtils::trim(rawName));
    if (name.empty()) name = "medium_quality";
    if (name.find('_') == std::string::npos) name += "_quality";

    // name, rank, standard entries, extreme entries, max layers, folds, bag repeats
    static const std::vector<PresetPolicy> presets = {
        {"medium_quality", 0, 4, false, 1, 5, 1},
        {"good_quality", 1, 6, false, 1, 5, 1},
        {"high_quality", 2, 8, false, 2, 8, 1},
        {"best_quality", 3, kAllEntries, false, 2, 8, 1},
        {"extreme_quality", 4, kAllEntries, true, 2, 8, 2},
    };
    for (const auto& p : presets) {
        if (p.name == name) return p;
    }
    throw Strata::ConfigurationException("Unknown preset '" + rawName
                                         + "' (expected medium|good|high|best|extreme[_quality])");
}

const std::vector<Portfolio::Entry>& Portfolio::defaultEntries() {
    static const std::vector<Entry> entries = [] {
        std::vector<Entry> e;
        auto add = [&e](std::string name, std::string family, Hyperparameters hp) -> Entry& {
            Entry entry;
            entry.name = std::move(name);
            entry.family = std::move(family);
            entry.hyperparameters = std::move(hp);
            e.push_back(std::move(entry));
            return e.back();
        };

        add("NeuralNet", "mlp", {{"hidden", 32}, {"layers", 1}, {"epochs", 60}, {"lr", 0.01}});
        add("DecisionTree", "tree", {{"max_depth", 6}, {"min_leaf", 5}});
        add("LinearModel", "linear", {{"lambda", 1.0}});
        Entry& knn = add("KNeighborsDist", "knn", {{"k", 10}, {"weighted", 1}});
        knn.maxRows = 100000;
        knn.allowInStackLayers = false;
        add("DecisionTreeDeep", "tree", {{"max_depth", 10}, {"min_leaf", 2}});
        add("NeuralNetDeep", "mlp", {{"hidden", 64}, {"layers", 2}, {"epochs", 80}, {"lr", 0.005}});
        add("LinearModelStrong", "linear", {{"lambda", 10.0}});
        Entry& knnUnif = add("KNeighborsUnif", "knn", {{"k", 25}, {"weighted", 0}});
        knnUnif.maxRows = 100000;
        knnUnif.allowInStackLayers = false;
        Entry& gpuNet = add("NeuralNetGPU", "mlp", {{"hidden", 128}, {"layers", 2}, {"epochs", 100}, {"lr", 0.003}, {"gpus", 1}});
        gpuNet.requiresGpu = true;
        Entry& constant = add("Baseline", "constant", {});
        constant.allowInStackLayers = false;

        Entry& foundation = add("InContext", "incontext", {{"max_context", 4096}});
        foundation.extremeOnly = true;
        foundation.requiresExternalWeights = true;
        foundation.weightsId = "strata-incontext-v1";
        foundation.gpuShareable = true;
        foundation.maxFeatures = 500;
        Entry& treeXl = add("DecisionTreeXL", "tree", {{"max_depth", 14}, {"min_leaf", 1}});
        treeXl.extremeOnly = true;
        Entry& knnXl = add("KNeighborsWide", "knn", {{"k", 50}, {"weighted", 1}});
        knnXl.extremeOnly = true;
        knnXl.maxRows = 50000;
        knnXl.allowInStackLayers = false;
        Entry& netXl = add("NeuralNetWide", "mlp", {{"hidden", 128}, {"layers", 3}, {"epochs", 120}, {"lr", 0.003}});
        netXl.extremeOnly = true;
        netXl.minRows = 100;
        return e;
    }();
    return entries;
}

PortfolioResult Portfolio::build(const PortfolioQuery& query,
                                 const ResourceSnapshot& snapshot,
                                 const FamilyRegistry& registry,
                                 const std::vector<Entry>& entries) {
    PortfolioResult result;
    result.preset = parsePreset(query.preset);

    PresetPolicy scope = result.preset;
    if (scope.includeExtreme && query.rows > query.extremeRowThreshold) {
        result.extremeGated = true;
        scope.includeExtreme = false;
        scope.standardEntries = kAllEntries;
        result.notes.push_back("extreme_quality disabled: " + std::to_string(query.rows) + " rows exceeds the "
                               + std::to_string(query.extremeRowThreshold)
                               + "-row gate; using the best_quality candidate set");
    }

    const std::unordered_set<std::string> excluded(query.excludedFamilies.begin(), query.excludedFamilies.end());
    DatasetTraits traits;
    traits.rows = query.rows;
    traits.features = query.features;
    traits.classes = query.classes;
    traits.quantiles = query.quantiles;
    traits.problemType = query.problemType;

    std::vector<std::string> gpuOnly;
    size_t standardSeen = 0;
    for (const auto& entry : entries) {
        if (entry.extremeOnly) {
            if (!scope.includeExtreme) continue;
        } else {
            if (standardSeen >= scope.standardEntries) continue;
            ++standardSeen;
        }

        if (excluded.count(entry.family)) {
            result.notes.push_back(entry.name + " skipped: family '" + entry.family + "' excluded");
            continue;
        }
        if (entry.requiresGpu && snapshot.gpus <= 0) {
            gpuOnly.push_back(entry.name);
            continue;
        }
        if (query.rows < entry.minRows || (entry.maxRows > 0 && query.rows > entry.maxRows)) {
            result.notes.push_back(entry.name + " skipped: " + std::to_string(query.rows) + " rows outside its supported range");
            continue;
        }
        if (entry.maxFeatures > 0 && query.features > entry.maxFeatures) {
            result.notes.push_back(entry.name + " skipped: more than " + std::to_string(entry.maxFeatures) + " features");
            continue;
        }

        CandidateConfig cfg;
        cfg.name = entry.name;
        cfg.family = entry.family;
        cfg.hyperparameters = entry.hyperparameters;
        cfg.priority = result.candidates.size();
        cfg.requiresGpu = entry.requiresGpu;
        cfg.gpuShareable = entry.gpuShareable;
        cfg.requiresExternalWeights = entry.requiresExternalWeights;
        cfg.weightsId = entry.weightsId;
        cfg.allowInStackLayers = entry.allowInStackLayers;

        // Unknown families stay in the list and fail individually in the builder.
        if (const auto family = registry.find(entry.family)) {
            if (!family->capabilities().supports(query.problemType)) {
                result.notes.push_back(entry.name + " skipped: " + family->name() + " does not support "
                                       + problemTypeName(query.problemType));
                continue;
            }
            cfg.estimate = family->estimate(traits, entry.hyperparameters);
        }
        result.candidates.push_back(std::move(cfg));
    }

    if (!gpuOnly.empty()) {
        result.notes.push_back("No GPU detected; excluded GPU-only candidate(s): " + joinNames(gpuOnly));
    }
    return result;
}
