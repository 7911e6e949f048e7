#pragma once
#include "TabularData.h"

#include <string>
#include <vector>

using FeatureMatrix = std::vector<std::vector<double>>;
// One row per input row; width depends on the problem type (see outputWidth()).
using PredictionMatrix = std::vector<std::vector<double>>;

enum class ProblemType { BINARY, MULTICLASS, REGRESSION, QUANTILE };

std::string problemTypeName(ProblemType type);
bool isClassification(ProblemType type) noexcept;
size_t outputWidth(ProblemType type, size_t numClasses, size_t numQuantiles) noexcept;

/**
 * Immutable numeric training table: encoded feature rows, labels (class index for
 * classification, target value otherwise) and optional per-row sample weights.
 */
class Dataset {
public:
    Dataset() = default;
    Dataset(FeatureMatrix features,
            std::vector<double> labels,
            std::vector<double> weights = {},
            std::vector<std::string> featureNames = {});

    size_t rowCount() const noexcept { return features_.size(); }
    size_t featureCount() const noexcept { return featureNames_.size(); }

    const FeatureMatrix& features() const noexcept { return features_; }
    const std::vector<double>& labels() const noexcept { return labels_; }
    const std::vector<double>& weights() const noexcept { return weights_; }
    const std::vector<std::string>& featureNames() const noexcept { return featureNames_; }
    bool hasLabels() const noexcept { return !labels_.empty(); }
    bool hasWeights() const noexcept { return !weights_.empty(); }

    Dataset subset(const std::vector<size_t>& rows) const;

    /**
     * @brief Returns a copy whose rows are extended with extra columns.
     * @pre extra.size() == rowCount() and every extra row has names.size() values.
     * @throws Strata::DatasetException on shape mismatch.
     */
    Dataset withAppendedFeatures(const FeatureMatrix& extra, const std::vector<std::string>& names) const;

    Dataset withFeatures(FeatureMatrix features, std::vector<std::string> names) const;

private:
    FeatureMatrix features_;
    std::vector<double> labels_;
    std::vector<double> weights_;
    std::vector<std::string> featureNames_;
};

/**
 * Learns the feature/label encoding on training data and applies it to any table with
 * the same columns. Numeric features get training-median imputation; categorical
 * features map to category codes with -1 for missing or unseen values.
 */
class DatasetEncoder {
public:
    struct FeatureEncoding {
        std::string name;
        ColumnType type = ColumnType::NUMERIC;
        double fillValue = 0.0;
        std::vector<std::string> categories;
    };

    /**
     * @brief Infers the problem type of a label column.
     * @throws Strata::DatasetException when the label has fewer than two distinct values.
     */
    static ProblemType inferProblemType(const TypedColumn& label);

    /**
     * @brief Learns encodings from the training table.
     * @throws Strata::ConfigurationException when the label or weight column is absent or unusable.
     * @throws Strata::DatasetException when no feature columns or labelled rows remain.
     */
    void fit(const TabularData& data,
             const std::string& labelColumn,
             ProblemType problemType,
             const std::string& weightColumn = "",
             const std::vector<std::string>& excludedColumns = {});

    /**
     * @brief Encodes a table. Rows with a missing label are dropped when requireLabel is set.
     * @throws Strata::DatasetException when a feature column is absent or a label is unknown.
     */
    Dataset transform(const TabularData& data, bool requireLabel) const;

    ProblemType problemType() const noexcept { return problemType_; }
    size_t numClasses() const noexcept { return classLabels_.size(); }
    const std::vector<std::string>& classLabels() const noexcept { return classLabels_; }
    const std::vector<FeatureEncoding>& featureEncodings() const noexcept { return features_; }
    const std::string& labelColumn() const noexcept { return labelColumn_; }

private:
    static std::string numericLabelKey(double v);

    std::vector<FeatureEncoding> features_;
    std::string labelColumn_;
    std::string weightColumn_;
    ProblemType problemType_ = ProblemType::REGRESSION;
    std::vector<std::string> classLabels_;
};
