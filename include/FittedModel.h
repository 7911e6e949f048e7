#pragma once
#include "ModelFamily.h"
#include "Portfolio.h"

#include <memory>
#include <string>
#include <vector>

/**
 * A candidate trained on one stack layer. Built once by the layer builder and shared as
 * shared_ptr<const FittedModel>; retraining produces a new instance.
 */
struct FittedModel {
    std::string name;
    CandidateConfig config;
    std::shared_ptr<const ModelFamily> family;
    size_t layer = 0;
    // Arena indices of the previous-layer models whose OOF columns are part of this model's input.
    std::vector<size_t> inputModels;
    // Whether the original features precede the input models' columns.
    bool keepOriginalFeatures = true;
    // One artifact per fold per repeat, repeat-major.
    std::vector<std::shared_ptr<const ModelArtifact>> foldArtifacts;
    std::shared_ptr<const ModelArtifact> refitArtifact;
    PredictionMatrix oof;
    double validationScore = 0.0;
    double fitSeconds = 0.0;
    double predictSeconds = 0.0;
    size_t memoryBytes = 0;

    /**
     * @brief Inference on already stacked feature rows: the refit artifact when present,
     *        otherwise the mean of the fold artifacts.
     * @throws Strata::CandidateException when the model holds no artifacts.
     */
    PredictionMatrix predict(const FeatureMatrix& rows) const;
};
