#include "AutoConfig.h"
#include "CommonUtils.h"
#include "EnsembleSelector.h"
#include "Metrics.h"
#include "Portfolio.h"
#include "StrataExceptions.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <set>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Strata::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Strata::StrataException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Strata::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Inline comment after an unquoted value: "time_limit: 30  # seconds"
std::string stripTrailingComment(const std::string& value) {
    const size_t hash = findSeparatorOutsideQuotes(value, '#');
    return hash == std::string::npos ? value : CommonUtils::trim(value.substr(0, hash));
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::toLower(CommonUtils::trim(key));
    while (!key.empty() && key.front() == '-') key.erase(key.begin());
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Strata::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw Strata::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Strata::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Strata::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Strata::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::vector<double> parseDoubleList(const std::string& value, const std::string& key) {
    std::vector<double> out;
    for (const auto& token : CommonUtils::splitList(value, ',')) {
        out.push_back(parseDoubleStrict(token, key, -std::numeric_limits<double>::max()));
    }
    return out;
}

bool isIn(const std::string& value, const std::vector<std::string>& allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}
} // namespace

void AutoConfig::set(const std::string& rawKey, const std::string& rawValue) {
    const std::string key = normalizeConfigKey(rawKey);
    const std::string value = CommonUtils::trim(rawValue);

    if (key == "delimiter") {
        if (value == "\\t" || value == "tab") {
            delimiter = '\t';
            return;
        }
        if (value.size() != 1) throw Strata::ConfigurationException("delimiter expects a single character");
        delimiter = value[0];
        return;
    }
    if (key == "exclude") {
        excludedColumns = CommonUtils::splitList(value, ',');
        return;
    }
    if (key == "excluded_families") {
        excludedFamilies.clear();
        for (const auto& f : CommonUtils::splitList(value, ',')) excludedFamilies.push_back(CommonUtils::toLower(f));
        return;
    }
    if (key == "quantile_levels") {
        quantileLevels = parseDoubleList(value, key);
        return;
    }

    struct IntRule {
        int AutoConfig::*member;
        int minValue;
    };
    struct SizeRule {
        size_t AutoConfig::*member;
        int minValue;
    };
    struct DoubleRule {
        double AutoConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string AutoConfig::*> rawStringFields = {
        {"dataset", &AutoConfig::datasetPath},
        {"label", &AutoConfig::labelColumn},
        {"test", &AutoConfig::testPath},
        {"predictions_out", &AutoConfig::predictionsOut},
        {"leaderboard_out", &AutoConfig::leaderboardOut},
        {"oof_out", &AutoConfig::oofOut},
        {"weight_column", &AutoConfig::weightColumn},
        {"weights_dir", &AutoConfig::weightsDir}
    };
    static const std::unordered_map<std::string, std::string AutoConfig::*> lowerStringFields = {
        {"export_format", &AutoConfig::exportFormat},
        {"problem_type", &AutoConfig::problemType},
        {"eval_metric", &AutoConfig::evalMetric},
        {"preset", &AutoConfig::preset},
        {"ensemble_tie_break", &AutoConfig::ensembleTieBreak}
    };
    static const std::unordered_map<std::string, bool AutoConfig::*> boolFields = {
        {"stack_use_original_features", &AutoConfig::stackUseOriginalFeatures},
        {"refit_full", &AutoConfig::refitFull},
        {"prune_unused_models", &AutoConfig::pruneUnusedModels},
        {"verbose", &AutoConfig::verbose}
    };
    static const std::unordered_map<std::string, IntRule> intFields = {
        {"kfold", {&AutoConfig::kfold, 0}},
        {"bag_sets", {&AutoConfig::bagSets, 0}},
        {"max_layers", {&AutoConfig::maxLayers, 0}},
        {"ensemble_rounds", {&AutoConfig::ensembleRounds, 1}},
        {"num_cpus", {&AutoConfig::numCpus, 0}},
        {"num_gpus", {&AutoConfig::numGpus, -1}}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"extreme_row_threshold", {&AutoConfig::extremeRowThreshold, 0}},
        {"gpu_memory_mb", {&AutoConfig::gpuMemoryMb, 0}},
        {"max_resident_model_mb", {&AutoConfig::maxResidentModelMb, 0}}
    };
    static const std::unordered_map<std::string, DoubleRule> doubleFields = {
        {"time_limit", {&AutoConfig::timeLimit, -std::numeric_limits<double>::max()}},
        {"min_model_cost_seconds", {&AutoConfig::minModelCostSeconds, 0.0}},
        {"grace_seconds", {&AutoConfig::graceSeconds, 0.0}},
        {"max_time_limit_ratio", {&AutoConfig::maxTimeLimitRatio, 0.0}},
        {"max_time_limit", {&AutoConfig::maxTimeLimit, 0.0}},
        {"ensemble_tolerance", {&AutoConfig::ensembleTolerance, 0.0}},
        {"ensemble_tie_epsilon", {&AutoConfig::ensembleTieEpsilon, 0.0}}
    };

    if (auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        this->*(it->second) = value;
        return;
    }
    if (auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        this->*(it->second) = CommonUtils::toLower(value);
        return;
    }
    if (auto it = boolFields.find(key); it != boolFields.end()) {
        this->*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (auto it = intFields.find(key); it != intFields.end()) {
        this->*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return;
    }
    if (auto it = sizeFields.find(key); it != sizeFields.end()) {
        this->*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (auto it = doubleFields.find(key); it != doubleFields.end()) {
        this->*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    if (key == "seed") {
        seed = parseUIntStrict(value, key);
        return;
    }
    throw Strata::ConfigurationException("Unknown option: " + rawKey);
}

std::string AutoConfig::usage() {
    return "Usage: strata <train.csv> --label <column> [--config path] [--test path] [--predictions-out path] "
           "[--leaderboard-out path] [--export-format csv|parquet] [--oof-out path] [--delimiter ,] "
           "[--weight-column col] [--exclude a,b] [--problem-type auto|binary|multiclass|regression|quantile] "
           "[--quantile-levels 0.1,0.5,0.9] [--eval-metric auto|log_loss|accuracy|rmse|mae|r2|pinball] "
           "[--time-limit seconds] [--preset medium|good|high|best|extreme] [--kfold N] [--bag-sets N] "
           "[--max-layers N] [--stack-use-original-features true|false] [--refit-full true|false] "
           "[--min-model-cost-seconds N] [--grace-seconds N] [--max-time-limit-ratio 0..1] [--max-time-limit N] "
           "[--ensemble-rounds N] [--ensemble-tolerance N] [--ensemble-tie-epsilon N] "
           "[--ensemble-tie-break fit_time|insertion] [--extreme-row-threshold N] [--excluded-families a,b] "
           "[--num-cpus N] [--num-gpus N] [--gpu-memory-mb N] [--weights-dir path] "
           "[--prune-unused-models true|false] [--max-resident-model-mb N] [--seed N] [--verbose true|false]";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        throw Strata::ConfigurationException(usage());
    }

    AutoConfig config;
    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw Strata::ConfigurationException("--config expects a path");
            configPath = argv[i + 1];
        }
    }
    if (!configPath.empty()) {
        config = fromFile(configPath, config);
    }
    config.datasetPath = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Strata::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Strata::ConfigurationException(arg + " expects a value");
        }
        const std::string value = argv[++i];
        if (arg == "--config") continue;
        config.set(arg, value);
    }

    config.validate();
    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Strata::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(stripTrailingComment(line.substr(sep + 1)));

        try {
            config.set(key, value);
        } catch (const Strata::StrataException& ex) {
            throw Strata::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void AutoConfig::validate() const {
    if (CommonUtils::trim(labelColumn).empty()) {
        throw Strata::ConfigurationException("label column is required (--label)");
    }
    if (!(timeLimit > 0.0)) {
        throw Strata::ConfigurationException("time_limit must be > 0 seconds");
    }
    if (!isIn(problemType, {"auto", "binary", "multiclass", "regression", "quantile"})) {
        throw Strata::ConfigurationException("problem_type must be one of: auto, binary, multiclass, regression, quantile");
    }
    if (!isIn(exportFormat, {"csv", "parquet"})) {
        throw Strata::ConfigurationException("export_format must be csv or parquet");
    }
    if (evalMetric != "auto" && !isIn(evalMetric, Metrics::knownNames())) {
        throw Strata::ConfigurationException("Unknown eval_metric: " + evalMetric);
    }
    parsePreset(preset);
    parseTieBreak(ensembleTieBreak);

    if (problemType == "quantile") {
        if (quantileLevels.empty()) {
            throw Strata::ConfigurationException("quantile_levels must not be empty for quantile problems");
        }
        std::set<double> seen;
        for (double q : quantileLevels) {
            if (!(q > 0.0 && q < 1.0)) {
                throw Strata::ConfigurationException("quantile_levels must lie strictly between 0 and 1");
            }
            if (!seen.insert(q).second) {
                throw Strata::ConfigurationException("quantile_levels must not repeat a level");
            }
        }
    }

    if (kfold == 1) throw Strata::ConfigurationException("kfold must be >= 2 when set");
    if (maxTimeLimitRatio <= 0.0 || maxTimeLimitRatio > 1.0) {
        throw Strata::ConfigurationException("max_time_limit_ratio must be within (0,1]");
    }
    if (ensembleRounds < 1) throw Strata::ConfigurationException("ensemble_rounds must be >= 1");
    if (numCpus < 0 || numGpus < -1) {
        throw Strata::ConfigurationException("num_cpus must be >= 0 and num_gpus >= -1");
    }
    if (!weightColumn.empty() && weightColumn == labelColumn) {
        throw Strata::ConfigurationException("weight_column must differ from the label column");
    }
    if (!predictionsOut.empty() && testPath.empty()) {
        throw Strata::ConfigurationException("predictions_out requires --test");
    }
}
