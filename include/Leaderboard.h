#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct LeaderboardEntry {
    size_t modelIndex = 0;
    std::string modelName;
    std::string family;
    double validationScore = 0.0;
    double fitSeconds = 0.0;
    double predictSeconds = 0.0;
    size_t memoryBytes = 0;
    size_t layer = 0;
};

/**
 * Append-only fit log. Ranking direction comes from the metric's declared direction;
 * equal scores keep insertion order.
 */
class Leaderboard {
public:
    Leaderboard() = default;
    Leaderboard(std::string metricName, bool higherIsBetter)
        : metricName_(std::move(metricName)), higherIsBetter_(higherIsBetter) {}

    void append(LeaderboardEntry entry) { entries_.push_back(std::move(entry)); }

    const std::vector<LeaderboardEntry>& entries() const noexcept { return entries_; }
    size_t size() const noexcept { return entries_.size(); }
    const std::string& metricName() const noexcept { return metricName_; }
    bool higherIsBetter() const noexcept { return higherIsBetter_; }

    std::vector<LeaderboardEntry> ranked() const;
    std::optional<LeaderboardEntry> find(const std::string& modelName) const;
    std::optional<LeaderboardEntry> findByIndex(size_t modelIndex) const;
    std::optional<LeaderboardEntry> bestInLayer(size_t layer) const;

private:
    bool better(double a, double b) const noexcept { return higherIsBetter_ ? a > b : a < b; }

    std::string metricName_;
    bool higherIsBetter_ = false;
    std::vector<LeaderboardEntry> entries_;
};
