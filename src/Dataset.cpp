#include "Dataset.h"
#include "CommonUtils.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

std::string problemTypeName(ProblemType type) {
    switch (type) {
        case ProblemType::BINARY: return "binary";
        case ProblemType::MULTICLASS: return "multiclass";
        case ProblemType::REGRESSION: return "regression";
        case ProblemType::QUANTILE: return "quantile";
    }
    return "unknown";
}

bool isClassification(ProblemType type) noexcept {
    return type == ProblemType::BINARY || type == ProblemType::MULTICLASS;
}

size_t outputWidth(ProblemType type, size_t numClasses, size_t numQuantiles) noexcept {
    switch (type) {
        case ProblemType::BINARY: return 1;
        case ProblemType::MULTICLASS: return numClasses;
        case ProblemType::REGRESSION: return 1;
        case ProblemType::QUANTILE: return numQuantiles;
    }
    return 1;
}

Dataset::Dataset(FeatureMatrix features,
                 std::vector<double> labels,
                 std::vector<double> weights,
                 std::vector<std::string> featureNames)
    : features_(std::move(features)),
      labels_(std::move(labels)),
      weights_(std::move(weights)),
      featureNames_(std::move(featureNames)) {
    if (!labels_.empty() && labels_.size() != features_.size()) {
        throw Strata::DatasetException("Label count does not match row count");
    }
    if (!weights_.empty() && weights_.size() != features_.size()) {
        throw Strata::DatasetException("Weight count does not match row count");
    }
    const size_t width = features_.empty() ? featureNames_.size() : features_.front().size();
    if (featureNames_.empty()) {
        for (size_t j = 0; j < width; ++j) featureNames_.push_back("f" + std::to_string(j));
    }
    for (const auto& row : features_) {
        if (row.size() != featureNames_.size()) {
            throw Strata::DatasetException("Ragged feature matrix: expected "
                                           + std::to_string(featureNames_.size()) + " columns");
        }
    }
}

Dataset Dataset::subset(const std::vector<size_t>& rows) const {
    FeatureMatrix x;
    std::vector<double> y;
    std::vector<double> w;
    x.reserve(rows.size());
    if (hasLabels()) y.reserve(rows.size());
    if (hasWeights()) w.reserve(rows.size());
    for (size_t r : rows) {
        if (r >= features_.size()) throw Strata::DatasetException("Row index out of range in subset");
        x.push_back(features_[r]);
        if (hasLabels()) y.push_back(labels_[r]);
        if (hasWeights()) w.push_back(weights_[r]);
    }
    return Dataset(std::move(x), std::move(y), std::move(w), featureNames_);
}

Dataset Dataset::withAppendedFeatures(const FeatureMatrix& extra, const std::vector<std::string>& names) const {
    if (extra.size() != features_.size()) {
        throw Strata::DatasetException("Appended feature block has " + std::to_string(extra.size())
                                       + " rows, expected " + std::to_string(features_.size()));
    }
    FeatureMatrix x = features_;
    for (size_t r = 0; r < x.size(); ++r) {
        if (extra[r].size() != names.size()) {
            throw Strata::DatasetException("Appended feature row width does not match names");
        }
        x[r].insert(x[r].end(), extra[r].begin(), extra[r].end());
    }
    std::vector<std::string> allNames = featureNames_;
    allNames.insert(allNames.end(), names.begin(), names.end());
    return Dataset(std::move(x), labels_, weights_, std::move(allNames));
}

Dataset Dataset::withFeatures(FeatureMatrix features, std::vector<std::string> names) const {
    if (features.size() != features_.size()) {
        throw Strata::DatasetException("Replacement feature block has wrong row count");
    }
    return Dataset(std::move(features), labels_, weights_, std::move(names));
}

std::string DatasetEncoder::numericLabelKey(double v) {
    if (std::abs(v - std::round(v)) < 1e-12 && std::abs(v) < 1e15) {
        return std::to_string(static_cast<long long>(std::llround(v)));
    }
    std::ostringstream os;
    os.precision(12);
    os << v;
    return os.str();
}

ProblemType DatasetEncoder::inferProblemType(const TypedColumn& label) {
    size_t present = 0;
    for (uint8_t m : label.missing) present += (m == 0);

    if (label.type == ColumnType::CATEGORICAL) {
        const auto& values = std::get<std::vector<std::string>>(label.values);
        std::unordered_set<std::string> distinct;
        for (size_t i = 0; i < values.size(); ++i) {
            if (!label.missing[i]) distinct.insert(values[i]);
        }
        if (distinct.size() < 2) {
            throw Strata::DatasetException("Label '" + label.name + "' has fewer than two distinct values");
        }
        return distinct.size() == 2 ? ProblemType::BINARY : ProblemType::MULTICLASS;
    }

    const auto& values = std::get<std::vector<double>>(label.values);
    std::set<double> distinct;
    bool allIntegral = true;
    for (size_t i = 0; i < values.size(); ++i) {
        if (label.missing[i]) continue;
        distinct.insert(values[i]);
        if (std::abs(values[i] - std::round(values[i])) > 1e-12) allIntegral = false;
    }
    if (distinct.size() < 2) {
        throw Strata::DatasetException("Label '" + label.name + "' has fewer than two distinct values");
    }
    if (distinct.size() == 2) return ProblemType::BINARY;

    const double uniqueRatio = present > 0 ? static_cast<double>(distinct.size()) / static_cast<double>(present) : 1.0;
    if (allIntegral && distinct.size() <= 20 && uniqueRatio <= 0.05) return ProblemType::MULTICLASS;
    return ProblemType::REGRESSION;
}

void DatasetEncoder::fit(const TabularData& data,
                         const std::string& labelColumn,
                         ProblemType problemType,
                         const std::string& weightColumn,
                         const std::vector<std::string>& excludedColumns) {
    const int labelIdx = data.findColumnIndex(labelColumn);
    if (labelIdx < 0) {
        throw Strata::ConfigurationException("Label column '" + labelColumn + "' not found");
    }
    int weightIdx = -1;
    if (!weightColumn.empty()) {
        weightIdx = data.findColumnIndex(weightColumn);
        if (weightIdx < 0) {
            throw Strata::ConfigurationException("Weight column '" + weightColumn + "' not found");
        }
        if (data.columns()[static_cast<size_t>(weightIdx)].type != ColumnType::NUMERIC) {
            throw Strata::ConfigurationException("Weight column '" + weightColumn + "' must be numeric");
        }
    }

    labelColumn_ = labelColumn;
    weightColumn_ = weightColumn;
    problemType_ = problemType;
    classLabels_.clear();
    features_.clear();

    const TypedColumn& label = data.columns()[static_cast<size_t>(labelIdx)];
    if (isClassification(problemType)) {
        std::set<std::string> classes;
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (label.missing[r]) continue;
            if (label.type == ColumnType::NUMERIC) {
                classes.insert(numericLabelKey(std::get<std::vector<double>>(label.values)[r]));
            } else {
                classes.insert(std::get<std::vector<std::string>>(label.values)[r]);
            }
        }
        if (classes.size() < 2) {
            throw Strata::DatasetException("Classification label needs at least two classes");
        }
        if (problemType == ProblemType::BINARY && classes.size() != 2) {
            throw Strata::ConfigurationException("problem_type=binary but label has "
                                                 + std::to_string(classes.size()) + " classes");
        }
        classLabels_.assign(classes.begin(), classes.end());
    } else if (label.type != ColumnType::NUMERIC) {
        throw Strata::ConfigurationException("Label '" + labelColumn + "' is not numeric; cannot use "
                                             + problemTypeName(problemType));
    }

    std::unordered_set<std::string> excluded(excludedColumns.begin(), excludedColumns.end());
    for (const auto& col : data.columns()) {
        if (col.name == labelColumn || col.name == weightColumn) continue;
        if (excluded.count(col.name)) continue;

        FeatureEncoding enc;
        enc.name = col.name;
        enc.type = col.type;
        if (col.type == ColumnType::NUMERIC) {
            const auto& values = std::get<std::vector<double>>(col.values);
            std::vector<double> observed;
            observed.reserve(values.size());
            for (size_t r = 0; r < values.size(); ++r) {
                if (!col.missing[r]) observed.push_back(values[r]);
            }
            enc.fillValue = observed.empty() ? 0.0 : CommonUtils::quantileByNth(observed, 0.5);
        } else {
            const auto& values = std::get<std::vector<std::string>>(col.values);
            std::set<std::string> cats;
            for (size_t r = 0; r < values.size(); ++r) {
                if (!col.missing[r]) cats.insert(values[r]);
            }
            enc.categories.assign(cats.begin(), cats.end());
            enc.fillValue = -1.0;
        }
        features_.push_back(std::move(enc));
    }
    if (features_.empty()) {
        throw Strata::DatasetException("No feature columns remain after excluding label/weight/excluded columns");
    }
}

Dataset DatasetEncoder::transform(const TabularData& data, bool requireLabel) const {
    std::vector<const TypedColumn*> sources;
    sources.reserve(features_.size());
    for (const auto& enc : features_) {
        const int idx = data.findColumnIndex(enc.name);
        if (idx < 0) throw Strata::DatasetException("Feature column '" + enc.name + "' missing from input");
        const TypedColumn& col = data.columns()[static_cast<size_t>(idx)];
        if (enc.type == ColumnType::NUMERIC && col.type != ColumnType::NUMERIC) {
            throw Strata::DatasetException("Feature column '" + enc.name + "' was numeric during training");
        }
        sources.push_back(&col);
    }

    const TypedColumn* label = nullptr;
    const int labelIdx = data.findColumnIndex(labelColumn_);
    if (labelIdx >= 0) label = &data.columns()[static_cast<size_t>(labelIdx)];
    if (requireLabel && label == nullptr) {
        throw Strata::DatasetException("Label column '" + labelColumn_ + "' missing from input");
    }
    const TypedColumn* weight = nullptr;
    if (!weightColumn_.empty()) {
        const int wIdx = data.findColumnIndex(weightColumn_);
        if (wIdx >= 0) weight = &data.columns()[static_cast<size_t>(wIdx)];
    }

    std::vector<std::unordered_map<std::string, double>> codeMaps(features_.size());
    for (size_t j = 0; j < features_.size(); ++j) {
        for (size_t c = 0; c < features_[j].categories.size(); ++c) {
            codeMaps[j].emplace(features_[j].categories[c], static_cast<double>(c));
        }
    }
    std::unordered_map<std::string, double> classIndex;
    for (size_t k = 0; k < classLabels_.size(); ++k) classIndex.emplace(classLabels_[k], static_cast<double>(k));

    FeatureMatrix x;
    std::vector<double> y;
    std::vector<double> w;
    x.reserve(data.rowCount());

    for (size_t r = 0; r < data.rowCount(); ++r) {
        double target = 0.0;
        if (requireLabel) {
            if (label->missing[r]) continue;
            if (isClassification(problemType_)) {
                const std::string key = label->type == ColumnType::NUMERIC
                    ? numericLabelKey(std::get<std::vector<double>>(label->values)[r])
                    : std::get<std::vector<std::string>>(label->values)[r];
                auto it = classIndex.find(key);
                if (it == classIndex.end()) {
                    throw Strata::DatasetException("Unknown class label '" + key + "'");
                }
                target = it->second;
            } else {
                target = std::get<std::vector<double>>(label->values)[r];
            }
        }

        std::vector<double> row(features_.size(), 0.0);
        for (size_t j = 0; j < features_.size(); ++j) {
            const TypedColumn& col = *sources[j];
            if (col.missing[r]) {
                row[j] = features_[j].fillValue;
                continue;
            }
            if (features_[j].type == ColumnType::NUMERIC) {
                row[j] = std::get<std::vector<double>>(col.values)[r];
            } else if (col.type == ColumnType::NUMERIC) {
                auto it = codeMaps[j].find(numericLabelKey(std::get<std::vector<double>>(col.values)[r]));
                row[j] = it == codeMaps[j].end() ? -1.0 : it->second;
            } else {
                auto it = codeMaps[j].find(std::get<std::vector<std::string>>(col.values)[r]);
                row[j] = it == codeMaps[j].end() ? -1.0 : it->second;
            }
        }
        x.push_back(std::move(row));
        if (requireLabel) y.push_back(target);
        if (weight != nullptr) {
            const double wv = weight->missing[r] ? 1.0 : std::get<std::vector<double>>(weight->values)[r];
            w.push_back(std::max(0.0, wv));
        }
    }

    if (requireLabel && x.empty()) {
        throw Strata::DatasetException("No rows with a present label");
    }

    std::vector<std::string> names;
    names.reserve(features_.size());
    for (const auto& enc : features_) names.push_back(enc.name);
    return Dataset(std::move(x), std::move(y), std::move(w), std::move(names));
}
