#include "BuiltinFamilies.h"
#include "FamilyUtils.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
struct TreeNode {
    int feature = -1;
    double threshold = 0.0;
    int left = -1;
    int right = -1;
    std::vector<double> value;
};

struct TreeArtifact : ModelArtifact {
    std::vector<TreeNode> nodes;

    size_t memoryBytes() const override {
        size_t bytes = sizeof(*this);
        for (const auto& n : nodes) bytes += sizeof(TreeNode) + n.value.size() * sizeof(double);
        return bytes;
    }

    const std::vector<double>& route(const std::vector<double>& row) const {
        size_t idx = 0;
        while (nodes[idx].feature >= 0) {
            const TreeNode& n = nodes[idx];
            idx = static_cast<size_t>(row[static_cast<size_t>(n.feature)] <= n.threshold ? n.left : n.right);
        }
        return nodes[idx].value;
    }
};

struct SplitChoice {
    int feature = -1;
    double threshold = 0.0;
    double impurity = 0.0;
};

class TreeBuilder {
public:
    TreeBuilder(const Dataset& train, const FitContext& ctx, int maxDepth, size_t minLeaf, double smoothing)
        : train_(train), ctx_(ctx), maxDepth_(maxDepth), minLeaf_(minLeaf), smoothing_(smoothing),
          classification_(isClassification(ctx.problemType)) {}

    std::vector<TreeNode> build() {
        std::vector<size_t> rows(train_.rowCount());
        std::iota(rows.begin(), rows.end(), 0);
        grow(rows, 0);
        return std::move(nodes_);
    }

private:
    double impurity(const std::vector<size_t>& rows) const {
        double w = 0.0;
        if (classification_) {
            std::vector<double> counts(ctx_.numClasses, 0.0);
            for (size_t r : rows) {
                const double wi = FamilyUtils::rowWeight(train_, r);
                counts[static_cast<size_t>(train_.labels()[r])] += wi;
                w += wi;
            }
            double sq = 0.0;
            for (double c : counts) sq += c * c;
            return w > 0.0 ? w - sq / w : 0.0;
        }
        double sum = 0.0;
        double sumSq = 0.0;
        for (size_t r : rows) {
            const double wi = FamilyUtils::rowWeight(train_, r);
            const double y = train_.labels()[r];
            w += wi;
            sum += wi * y;
            sumSq += wi * y * y;
        }
        return w > 0.0 ? sumSq - sum * sum / w : 0.0;
    }

    std::vector<double> leafValue(const std::vector<size_t>& rows) const {
        if (classification_) {
            std::vector<double> counts(ctx_.numClasses, smoothing_);
            for (size_t r : rows) counts[static_cast<size_t>(train_.labels()[r])] += FamilyUtils::rowWeight(train_, r);
            const double total = std::accumulate(counts.begin(), counts.end(), 0.0);
            for (double& c : counts) c = total > 0.0 ? c / total : 1.0 / static_cast<double>(counts.size());
            return FamilyUtils::toOutputRow(counts, ctx_.problemType);
        }
        if (ctx_.problemType == ProblemType::QUANTILE) {
            std::vector<double> values;
            std::vector<double> weights;
            values.reserve(rows.size());
            for (size_t r : rows) {
                values.push_back(train_.labels()[r]);
                if (train_.hasWeights()) weights.push_back(train_.weights()[r]);
            }
            return FamilyUtils::weightedQuantiles(values, weights, ctx_.quantileLevels);
        }
        double sum = 0.0;
        double w = 0.0;
        for (size_t r : rows) {
            const double wi = FamilyUtils::rowWeight(train_, r);
            sum += wi * train_.labels()[r];
            w += wi;
        }
        return {w > 0.0 ? sum / w : 0.0};
    }

    SplitChoice bestSplit(const std::vector<size_t>& rows) const {
        SplitChoice best;
        best.impurity = impurity(rows);
        const double parentImpurity = best.impurity;
        const size_t K = ctx_.numClasses;

        std::vector<size_t> order = rows;
        for (size_t feat = 0; feat < train_.featureCount(); ++feat) {
            std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
                return train_.features()[a][feat] < train_.features()[b][feat];
            });

            double totalW = 0.0, totalSum = 0.0, totalSq = 0.0;
            std::vector<double> totalCounts(classification_ ? K : 0, 0.0);
            for (size_t r : order) {
                const double wi = FamilyUtils::rowWeight(train_, r);
                totalW += wi;
                if (classification_) {
                    totalCounts[static_cast<size_t>(train_.labels()[r])] += wi;
                } else {
                    totalSum += wi * train_.labels()[r];
                    totalSq += wi * train_.labels()[r] * train_.labels()[r];
                }
            }

            double leftW = 0.0, leftSum = 0.0, leftSq = 0.0;
            std::vector<double> leftCounts(classification_ ? K : 0, 0.0);
            for (size_t i = 0; i + 1 < order.size(); ++i) {
                const size_t r = order[i];
                const double wi = FamilyUtils::rowWeight(train_, r);
                leftW += wi;
                if (classification_) {
                    leftCounts[static_cast<size_t>(train_.labels()[r])] += wi;
                } else {
                    leftSum += wi * train_.labels()[r];
                    leftSq += wi * train_.labels()[r] * train_.labels()[r];
                }

                const double here = train_.features()[r][feat];
                const double next = train_.features()[order[i + 1]][feat];
                if (next <= here) continue;
                if (i + 1 < minLeaf_ || order.size() - (i + 1) < minLeaf_) continue;

                const double rightW = totalW - leftW;
                if (leftW <= 0.0 || rightW <= 0.0) continue;
                double candidate = 0.0;
                if (classification_) {
                    double leftSqCounts = 0.0, rightSqCounts = 0.0;
                    for (size_t k = 0; k < K; ++k) {
                        leftSqCounts += leftCounts[k] * leftCounts[k];
                        const double rc = totalCounts[k] - leftCounts[k];
                        rightSqCounts += rc * rc;
                    }
                    candidate = (leftW - leftSqCounts / leftW) + (rightW - rightSqCounts / rightW);
                } else {
                    const double rightSum = totalSum - leftSum;
                    const double rightSq = totalSq - leftSq;
                    candidate = (leftSq - leftSum * leftSum / leftW) + (rightSq - rightSum * rightSum / rightW);
                }
                if (candidate < best.impurity - 1e-12 * std::max(1.0, std::abs(parentImpurity))) {
                    best.impurity = candidate;
                    best.feature = static_cast<int>(feat);
                    best.threshold = 0.5 * (here + next);
                }
            }
        }
        return best;
    }

    int grow(const std::vector<size_t>& rows, int depth) {
        ctx_.checkDeadline();
        const int index = static_cast<int>(nodes_.size());
        nodes_.emplace_back();

        SplitChoice split;
        if (depth < maxDepth_ && rows.size() >= 2 * minLeaf_) split = bestSplit(rows);
        if (split.feature < 0) {
            nodes_[static_cast<size_t>(index)].value = leafValue(rows);
            return index;
        }

        std::vector<size_t> leftRows;
        std::vector<size_t> rightRows;
        for (size_t r : rows) {
            if (train_.features()[r][static_cast<size_t>(split.feature)] <= split.threshold) {
                leftRows.push_back(r);
            } else {
                rightRows.push_back(r);
            }
        }
        const int left = grow(leftRows, depth + 1);
        const int right = grow(rightRows, depth + 1);
        TreeNode& node = nodes_[static_cast<size_t>(index)];
        node.feature = split.feature;
        node.threshold = split.threshold;
        node.left = left;
        node.right = right;
        return index;
    }

    const Dataset& train_;
    const FitContext& ctx_;
    int maxDepth_;
    size_t minLeaf_;
    double smoothing_;
    bool classification_;
    std::vector<TreeNode> nodes_;
};
} // namespace

FamilyCapabilities TreeFamily::capabilities() const {
    FamilyCapabilities caps;
    caps.problemTypes = {ProblemType::BINARY, ProblemType::MULTICLASS, ProblemType::REGRESSION, ProblemType::QUANTILE};
    return caps;
}

ResourceEstimate TreeFamily::estimate(const DatasetTraits& traits, const Hyperparameters& hp) const {
    const double depth = std::max(1.0, hyperparameterOr(hp, "max_depth", 6.0));
    const double n = static_cast<double>(std::max<size_t>(2, traits.rows));
    const double classCost = static_cast<double>(std::max<size_t>(1, traits.classes));
    ResourceEstimate est;
    est.fitSeconds = 1e-3 + n * std::log2(n) * static_cast<double>(traits.features) * depth * classCost * 2e-8;
    est.memoryBytes = static_cast<size_t>(n * sizeof(size_t) * 3 + std::pow(2.0, std::min(depth, 16.0)) * 64.0);
    return est;
}

FitOutput TreeFamily::fit(const Dataset& train, const Dataset& val, const Hyperparameters& hp, const FitContext& ctx) const {
    FamilyUtils::requireTrainingRows(train, name());
    const double depthParam = hyperparameterOr(hp, "max_depth", 6.0);
    if (!(depthParam >= 0.0)) throw Strata::CandidateException("tree: max_depth must be non-negative");
    const int maxDepth = static_cast<int>(std::min(depthParam, 64.0));
    const size_t minLeaf = FamilyUtils::countParameter(hyperparameterOr(hp, "min_leaf", 5.0), train.rowCount());
    const double smoothing = std::max(0.0, hyperparameterOr(hp, "smoothing", 1.0));

    auto artifact = std::make_unique<TreeArtifact>();
    artifact->nodes = TreeBuilder(train, ctx, maxDepth, minLeaf, smoothing).build();

    FitOutput out;
    out.valPredictions.reserve(val.rowCount());
    for (const auto& row : val.features()) out.valPredictions.push_back(artifact->route(row));
    FamilyUtils::requireFinite(out.valPredictions, name());
    out.artifact = std::move(artifact);
    return out;
}

PredictionMatrix TreeFamily::predict(const ModelArtifact& artifact, const FeatureMatrix& rows) const {
    const auto& a = FamilyUtils::artifactAs<TreeArtifact>(artifact, name());
    PredictionMatrix out;
    out.reserve(rows.size());
    for (const auto& row : rows) out.push_back(a.route(row));
    return out;
}
