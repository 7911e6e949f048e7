#include "Leaderboard.h"

#include <algorithm>

std::vector<LeaderboardEntry> Leaderboard::ranked() const {
    std::vector<LeaderboardEntry> out = entries_;
    std::stable_sort(out.begin(), out.end(), [this](const LeaderboardEntry& a, const LeaderboardEntry& b) {
        return better(a.validationScore, b.validationScore);
    });
    return out;
}

std::optional<LeaderboardEntry> Leaderboard::find(const std::string& modelName) const {
    for (const auto& e : entries_) {
        if (e.modelName == modelName) return e;
    }
    return std::nullopt;
}

std::optional<LeaderboardEntry> Leaderboard::findByIndex(size_t modelIndex) const {
    for (const auto& e : entries_) {
        if (e.modelIndex == modelIndex) return e;
    }
    return std::nullopt;
}

std::optional<LeaderboardEntry> Leaderboard::bestInLayer(size_t layer) const {
    std::optional<LeaderboardEntry> best;
    for (const auto& e : entries_) {
        if (e.layer != layer) continue;
        if (!best || better(e.validationScore, best->validationScore)) best = e;
    }
    return best;
}
