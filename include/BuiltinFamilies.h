#pragma once
#include "ModelFamily.h"

// Predicts the training mean, class priors or empirical quantiles. Never fails on valid data.
class ConstantFamily : public ModelFamily {
public:
    std::string name() const override { return "constant"; }
    FamilyCapabilities capabilities() const override;
    ResourceEstimate estimate(const DatasetTraits& traits, const Hyperparameters& hp) const override;
    FitOutput fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const override;
    PredictionMatrix predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const override;
};

// Ridge regression on standardized features; one-hot linear probability model for classification.
// Hyperparameters: lambda.
class LinearFamily : public ModelFamily {
public:
    std::string name() const override { return "linear"; }
    FamilyCapabilities capabilities() const override;
    ResourceEstimate estimate(const DatasetTraits& traits, const Hyperparameters& hp) const override;
    FitOutput fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const override;
    PredictionMatrix predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const override;
};

// CART with axis-aligned splits. Hyperparameters: max_depth, min_leaf, smoothing.
class TreeFamily : public ModelFamily {
public:
    std::string name() const override { return "tree"; }
    FamilyCapabilities capabilities() const override;
    ResourceEstimate estimate(const DatasetTraits& traits, const Hyperparameters& hp) const override;
    FitOutput fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const override;
    PredictionMatrix predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const override;
};

// Brute-force k nearest neighbours on standardized features. Hyperparameters: k, weighted, smoothing.
class KnnFamily : public ModelFamily {
public:
    std::string name() const override { return "knn"; }
    FamilyCapabilities capabilities() const override;
    ResourceEstimate estimate(const DatasetTraits& traits, const Hyperparameters& hp) const override;
    FitOutput fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const override;
    PredictionMatrix predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const override;
};

/**
 * Dense feed-forward network trained with Adam and early stopping on an internal holdout.
 * Quantile problems train one output per level with pinball loss.
 * Hyperparameters: hidden, layers, epochs, lr, batch, l2, patience, min_delta.
 */
class MlpFamily : public ModelFamily {
public:
    std::string name() const override { return "mlp"; }
    FamilyCapabilities capabilities() const override;
    ResourceEstimate estimate(const DatasetTraits& traits, const Hyperparameters& hp) const override;
    FitOutput fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const override;
    PredictionMatrix predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const override;
};

/**
 * Pretrained in-context learner: the training rows are the context and predictions are
 * kernel-weighted over it. Needs a weights file (key: value lines) resolved by the
 * weights provider; fit() fails with MissingDependencyException without one.
 */
class InContextFamily : public ModelFamily {
public:
    std::string name() const override { return "incontext"; }
    FamilyCapabilities capabilities() const override;
    ResourceEstimate estimate(const DatasetTraits& traits, const Hyperparameters& hp) const override;
    FitOutput fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const override;
    PredictionMatrix predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const override;
};
