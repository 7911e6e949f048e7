#include "FoldAssignment.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <limits>
#include <map>
#include <numeric>
#include <random>

FoldAssignment FoldAssignment::make(const std::vector<double>& labels,
                                    int numFolds,
                                    int numRepeats,
                                    bool stratify,
                                    uint32_t seed) {
    const size_t n = labels.size();
    if (n < 2) throw Strata::DatasetException("Need at least two training rows for k-fold validation");

    FoldAssignment out;
    out.rows_ = n;
    out.folds_ = std::clamp(numFolds, 2, static_cast<int>(std::min<size_t>(n, static_cast<size_t>(std::numeric_limits<int>::max()))));
    const int repeats = std::max(1, numRepeats);

    for (int r = 0; r < repeats; ++r) {
        std::mt19937 rng(seed + static_cast<uint32_t>(r) * 0x9e3779b9U);
        std::vector<size_t> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::shuffle(order.begin(), order.end(), rng);

        if (stratify) {
            // Group by class, keeping the shuffled order inside each class.
            std::map<double, std::vector<size_t>> byClass;
            for (size_t row : order) byClass[labels[row]].push_back(row);
            order.clear();
            for (auto& kv : byClass) order.insert(order.end(), kv.second.begin(), kv.second.end());
        }

        std::vector<int> foldOf(n, 0);
        std::vector<std::vector<size_t>> validation(static_cast<size_t>(out.folds_));
        for (size_t i = 0; i < n; ++i) {
            const int fold = static_cast<int>(i % static_cast<size_t>(out.folds_));
            foldOf[order[i]] = fold;
        }
        for (size_t row = 0; row < n; ++row) validation[static_cast<size_t>(foldOf[row])].push_back(row);

        std::vector<std::vector<size_t>> training(static_cast<size_t>(out.folds_));
        for (int f = 0; f < out.folds_; ++f) {
            auto& t = training[static_cast<size_t>(f)];
            t.reserve(n - validation[static_cast<size_t>(f)].size());
            for (size_t row = 0; row < n; ++row) {
                if (foldOf[row] != f) t.push_back(row);
            }
        }

        out.foldOf_.push_back(std::move(foldOf));
        out.validation_.push_back(std::move(validation));
        out.training_.push_back(std::move(training));
    }
    return out;
}

const std::vector<size_t>& FoldAssignment::validationRows(int repeat, int fold) const {
    return validation_.at(static_cast<size_t>(repeat)).at(static_cast<size_t>(fold));
}

const std::vector<size_t>& FoldAssignment::trainingRows(int repeat, int fold) const {
    return training_.at(static_cast<size_t>(repeat)).at(static_cast<size_t>(fold));
}

bool FoldAssignment::isPartition() const {
    for (size_t r = 0; r < validation_.size(); ++r) {
        std::vector<int> seen(rows_, 0);
        for (const auto& fold : validation_[r]) {
            if (fold.empty()) return false;
            for (size_t row : fold) {
                if (row >= rows_ || seen[row]++ > 0) return false;
            }
        }
        if (std::find(seen.begin(), seen.end(), 0) != seen.end()) return false;
    }
    return true;
}
