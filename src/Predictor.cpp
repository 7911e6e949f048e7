#include "Predictor.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <map>
#include <sstream>

Predictor::Predictor(std::shared_ptr<ModelRegistry> registry,
                     DatasetEncoder encoder,
                     EnsembleWeights weights,
                     PredictionMatrix ensembleOof,
                     FitSummary summary)
    : registry_(std::move(registry)),
      encoder_(std::move(encoder)),
      weights_(std::move(weights)),
      ensembleOof_(std::move(ensembleOof)),
      summary_(std::move(summary)) {
    if (!registry_) throw Strata::StrataException("Predictor requires a model registry");
    evaluationOrder_ = registry_->resolveDependencies(weights_.support());
}

PredictionMatrix Predictor::predictEncoded(const FeatureMatrix& rows) const {
    std::map<size_t, PredictionMatrix> outputs;
    for (size_t idx : evaluationOrder_) {
        std::shared_ptr<const FittedModel> model = registry_->get(idx);
        if (model->inputModels.empty()) {
            outputs[idx] = model->predict(rows);
            continue;
        }
        std::vector<const PredictionMatrix*> blocks;
        for (size_t in : model->inputModels) {
            auto it = outputs.find(in);
            if (it == outputs.end()) {
                throw Strata::StrataException(model->name + " needs model " + std::to_string(in) + " which was not evaluated");
            }
            blocks.push_back(&it->second);
        }
        outputs[idx] = model->predict(StackLayerBuilder::stackRows(rows, blocks, model->keepOriginalFeatures));
    }

    std::vector<std::pair<const PredictionMatrix*, double>> parts;
    for (const auto& w : weights_.weights) {
        if (w.second > 0.0) parts.emplace_back(&outputs.at(w.first), w.second);
    }
    return EnsembleSelector::blend(parts);
}

PredictionMatrix Predictor::predict(const TabularData& data) const {
    const Dataset encoded = encoder_.transform(data, false);
    return predictEncoded(encoded.features());
}

std::vector<std::string> Predictor::predictLabels(const TabularData& data) const {
    const PredictionMatrix p = predict(data);
    std::vector<std::string> out;
    out.reserve(p.size());
    const auto& labels = encoder_.classLabels();

    for (const auto& row : p) {
        if (summary_.problemType == ProblemType::BINARY) {
            out.push_back(labels.at(row.at(0) >= 0.5 ? 1 : 0));
        } else if (summary_.problemType == ProblemType::MULTICLASS) {
            const size_t k = static_cast<size_t>(std::max_element(row.begin(), row.end()) - row.begin());
            out.push_back(labels.at(k));
        } else {
            double point = row.at(0);
            if (summary_.problemType == ProblemType::QUANTILE) {
                const auto& levels = summary_.quantileLevels;
                const size_t mid = static_cast<size_t>(std::find(levels.begin(), levels.end(), 0.5) - levels.begin());
                point = row.at(std::min(mid, row.size() - 1));
            }
            std::ostringstream os;
            os.precision(10);
            os << point;
            out.push_back(os.str());
        }
    }
    return out;
}

PredictionMatrix Predictor::predictProba(const TabularData& data) const {
    if (!isClassification(summary_.problemType)) {
        throw Strata::ConfigurationException("predictProba is only available for classification problems");
    }
    PredictionMatrix p = predict(data);
    if (summary_.problemType == ProblemType::BINARY) {
        for (auto& row : p) {
            const double positive = std::clamp(row.at(0), 0.0, 1.0);
            row = {1.0 - positive, positive};
        }
    }
    return p;
}

PredictionMatrix Predictor::predictQuantiles(const TabularData& data) const {
    if (summary_.problemType != ProblemType::QUANTILE) {
        throw Strata::ConfigurationException("predictQuantiles is only available for quantile problems");
    }
    PredictionMatrix p = predict(data);
    for (auto& row : p) std::sort(row.begin(), row.end());
    return p;
}
