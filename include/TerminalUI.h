#pragma once
#include "Predictor.h"
#include <vector>
#include <string>

class TerminalUI {
public:
    static void printResources(const ResourceSnapshot& snapshot, double budgetSeconds);
    static void printLeaderboard(const Leaderboard& leaderboard, const EnsembleWeights& weights);
    static void printEnsemble(const ModelRegistry& registry, const EnsembleWeights& weights, const FitSummary& summary);
    static void printFailures(const std::vector<CandidateFailure>& failures);
    static void printSummary(const FitSummary& summary);
};
