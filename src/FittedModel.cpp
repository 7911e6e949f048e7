#include "FittedModel.h"
#include "StrataExceptions.h"

PredictionMatrix FittedModel::predict(const FeatureMatrix& rows) const {
    if (!family) throw Strata::CandidateException(name + ": no model family attached");
    if (refitArtifact) return family->predict(*refitArtifact, rows);
    if (foldArtifacts.empty()) throw Strata::CandidateException(name + ": no fitted artifacts");

    PredictionMatrix sum;
    for (const auto& artifact : foldArtifacts) {
        PredictionMatrix part = family->predict(*artifact, rows);
        if (sum.empty()) {
            sum = std::move(part);
            continue;
        }
        for (size_t r = 0; r < sum.size(); ++r) {
            for (size_t c = 0; c < sum[r].size(); ++c) sum[r][c] += part[r][c];
        }
    }
    const double inv = 1.0 / static_cast<double>(foldArtifacts.size());
    for (auto& row : sum) {
        for (double& v : row) v *= inv;
    }
    return sum;
}
