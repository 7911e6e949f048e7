#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * Repeated k-fold partition of training row indices, shared by every candidate of a fit
 * so out-of-fold predictions are comparable across models and layers.
 */
class FoldAssignment {
public:
    /**
     * @brief Builds numRepeats shuffled partitions into numFolds folds.
     * @pre labels holds one entry per training row; class indices when stratify is set.
     * @post numFolds is clamped to [2, rows]; within each repeat folds are disjoint, non-empty
     *       and cover every row.
     * @throws Strata::DatasetException when fewer than two rows are given.
     */
    static FoldAssignment make(const std::vector<double>& labels,
                               int numFolds,
                               int numRepeats,
                               bool stratify,
                               uint32_t seed);

    size_t rowCount() const noexcept { return rows_; }
    int folds() const noexcept { return folds_; }
    int repeats() const noexcept { return static_cast<int>(foldOf_.size()); }

    const std::vector<size_t>& validationRows(int repeat, int fold) const;
    const std::vector<size_t>& trainingRows(int repeat, int fold) const;
    int foldOf(int repeat, size_t row) const { return foldOf_.at(static_cast<size_t>(repeat)).at(row); }

    // Every row appears in exactly one validation fold per repeat.
    bool isPartition() const;

private:
    size_t rows_ = 0;
    int folds_ = 0;
    std::vector<std::vector<int>> foldOf_;
    std::vector<std::vector<std::vector<size_t>>> validation_;
    std::vector<std::vector<std::vector<size_t>>> training_;
};
