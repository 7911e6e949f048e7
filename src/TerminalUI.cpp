#include "TerminalUI.h"
#include "CommonUtils.h"
#include <iostream>
#include <iomanip>

void TerminalUI::printResources(const ResourceSnapshot& snapshot, double budgetSeconds) {
    std::cout << "\n================================================ RESOURCES =================================================\n";
    std::cout << "    CPUs: " << snapshot.cpus << " | GPUs: " << snapshot.gpus;
    if (snapshot.gpuMemoryBytes > 0) std::cout << " (" << (snapshot.gpuMemoryBytes >> 20) << " MB each)";
    if (snapshot.memoryBytes > 0) std::cout << " | Memory: " << (snapshot.memoryBytes >> 20) << " MB";
    std::cout << " | Budget: " << CommonUtils::formatSeconds(budgetSeconds) << "\n";
    std::cout << "============================================================================================================\n";
}

void TerminalUI::printLeaderboard(const Leaderboard& leaderboard, const EnsembleWeights& weights) {
    const std::vector<LeaderboardEntry> ranked = leaderboard.ranked();
    size_t maxNameLen = 20;
    for (const auto& e : ranked) maxNameLen = std::max(maxNameLen, e.modelName.length());

    int w = static_cast<int>(maxNameLen) + 2;
    std::cout << "\n=============================================== LEADERBOARD ================================================\n";
    std::cout << std::left
              << std::setw(6) << "Rank"
              << std::setw(w) << "Model"
              << std::setw(7) << "Layer"
              << std::setw(14) << leaderboard.metricName()
              << std::setw(12) << "Fit(s)"
              << std::setw(12) << "Pred(s)"
              << std::setw(12) << "Mem(KB)"
              << "Weight\n";
    std::cout << std::string(w + 6 + 7 + 14 + 12 * 3 + 6, '-') << "\n";

    for (size_t i = 0; i < ranked.size(); ++i) {
        const LeaderboardEntry& e = ranked[i];
        const double weight = weights.weightOf(e.modelIndex);
        std::cout << std::left << std::setw(6) << (i + 1)
                  << std::setw(w) << e.modelName
                  << std::setw(7) << (e.layer + 1)
                  << std::right << std::fixed << std::setprecision(5)
                  << std::setw(12) << e.validationScore << "  "
                  << std::setprecision(3)
                  << std::setw(10) << e.fitSeconds << "  "
                  << std::setw(10) << e.predictSeconds << "  "
                  << std::setw(10) << (e.memoryBytes >> 10) << "  ";
        if (weight > 0.0) std::cout << std::setprecision(3) << weight;
        std::cout << std::left << "\n";
    }
    std::cout << "============================================================================================================\n";
}

void TerminalUI::printEnsemble(const ModelRegistry& registry, const EnsembleWeights& weights, const FitSummary& summary) {
    std::cout << "\n[Strata][Ensemble] Greedy selection used " << weights.roundsUsed << " round(s) on layer "
              << (summary.finalLayer + 1) << "; " << summary.metricName << "=" << std::fixed << std::setprecision(5)
              << summary.ensembleScore << "\n";
    for (const auto& w : weights.weights) {
        if (w.second <= 0.0) continue;
        const auto entry = registry.leaderboard().findByIndex(w.first);
        std::cout << "        -> " << std::left << std::setw(32) << (entry ? entry->modelName : std::to_string(w.first))
                  << std::right << std::setprecision(3) << w.second << "\n";
    }
    if (!summary.haltReason.empty()) {
        std::cout << "        Stacking stopped: " << summary.haltReason << "\n";
    }
}

void TerminalUI::printFailures(const std::vector<CandidateFailure>& failures) {
    if (failures.empty()) return;
    std::cout << "\n============================================ EXCLUDED CANDIDATES ===========================================\n";
    for (const auto& f : failures) {
        std::cout << "    " << std::left << std::setw(28) << StackLayerBuilder::modelName(f.candidate, f.layer)
                  << std::setw(20) << failureKindName(f.kind) << f.reason << "\n";
    }
    std::cout << "============================================================================================================\n";
}

void TerminalUI::printSummary(const FitSummary& summary) {
    std::cout << "\n[Strata] " << problemTypeName(summary.problemType) << " | rows=" << summary.trainRows
              << " | features=" << summary.features << " | preset=" << summary.preset
              << " | folds=" << summary.folds << "x" << summary.repeats
              << " | layers=" << summary.layersBuilt
              << " | elapsed=" << CommonUtils::formatSeconds(summary.elapsedSeconds)
              << " of " << CommonUtils::formatSeconds(summary.budgetSeconds) << "\n";
    for (const auto& note : summary.notes) {
        std::cout << "        Note: " << note << "\n";
    }
}
