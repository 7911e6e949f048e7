#include "EnsembleSelector.h"
#include "CommonUtils.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

TieBreak parseTieBreak(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    if (n == "fit_time" || n == "fittime" || n.empty()) return TieBreak::FIT_TIME;
    if (n == "insertion" || n == "insertion_order") return TieBreak::INSERTION;
    throw Strata::ConfigurationException("ensemble_tie_break must be fit_time or insertion, got '" + name + "'");
}

double EnsembleWeights::weightOf(size_t modelIndex) const {
    for (const auto& w : weights) {
        if (w.first == modelIndex) return w.second;
    }
    return 0.0;
}

std::vector<size_t> EnsembleWeights::support() const {
    std::vector<size_t> out;
    for (const auto& w : weights) {
        if (w.second > 0.0) out.push_back(w.first);
    }
    return out;
}

EnsembleSelector::EnsembleSelector(SelectorConfig config, LossFn loss)
    : config_(config), loss_(std::move(loss)) {
    if (!loss_) throw Strata::ConfigurationException("Ensemble selector needs a loss function");
    if (config_.rounds < 1) throw Strata::ConfigurationException("ensemble_rounds must be at least 1");
    if (config_.tolerance < 0.0 || config_.tieEpsilon < 0.0) {
        throw Strata::ConfigurationException("ensemble tolerance and tie epsilon must be non-negative");
    }
}

PredictionMatrix EnsembleSelector::blend(const std::vector<std::pair<const PredictionMatrix*, double>>& parts) {
    PredictionMatrix out;
    double total = 0.0;
    for (const auto& part : parts) {
        if (part.second <= 0.0) continue;
        const PredictionMatrix& m = *part.first;
        if (out.empty()) {
            out.assign(m.size(), std::vector<double>(m.empty() ? 0 : m.front().size(), 0.0));
        }
        for (size_t r = 0; r < m.size(); ++r) {
            for (size_t c = 0; c < m[r].size(); ++c) out[r][c] += part.second * m[r][c];
        }
        total += part.second;
    }
    if (total > 0.0) {
        for (auto& row : out) {
            for (double& v : row) v /= total;
        }
    }
    return out;
}

EnsembleWeights EnsembleSelector::select(const std::vector<SelectorCandidate>& candidates) const {
    if (candidates.empty()) throw Strata::StrataException("Ensemble selection needs at least one candidate");
    const PredictionMatrix& first = *candidates.front().oof;
    const size_t rows = first.size();
    const size_t width = rows == 0 ? 0 : first.front().size();
    for (const auto& c : candidates) {
        if (c.oof == nullptr || c.oof->size() != rows || (rows > 0 && c.oof->front().size() != width)) {
            throw Strata::StrataException("Ensemble candidates must share one OOF shape");
        }
    }

    PredictionMatrix sum(rows, std::vector<double>(width, 0.0));
    std::map<size_t, int> counts;
    EnsembleWeights result;
    double currentLoss = std::numeric_limits<double>::infinity();
    std::vector<double> losses(candidates.size(), 0.0);

    for (int round = 0; round < config_.rounds; ++round) {
        const double denom = static_cast<double>(result.trace.size() + 1);
        const long long n = static_cast<long long>(candidates.size());

        #ifdef USE_OPENMP
        #pragma omp parallel for schedule(dynamic)
        #endif
        for (long long i = 0; i < n; ++i) {
            const PredictionMatrix& add = *candidates[static_cast<size_t>(i)].oof;
            PredictionMatrix trial(rows, std::vector<double>(width, 0.0));
            for (size_t r = 0; r < rows; ++r) {
                for (size_t c = 0; c < width; ++c) trial[r][c] = (sum[r][c] + add[r][c]) / denom;
            }
            double loss = std::numeric_limits<double>::infinity();
            try {
                loss = loss_(trial);
            } catch (const std::exception&) {
                loss = std::numeric_limits<double>::infinity();
            }
            losses[static_cast<size_t>(i)] = std::isfinite(loss) ? loss : std::numeric_limits<double>::infinity();
        }

        const double minLoss = *std::min_element(losses.begin(), losses.end());
        if (!std::isfinite(minLoss)) {
            if (result.trace.empty()) throw Strata::NumericalException("no ensemble candidate produced a finite loss");
            break;
        }

        size_t best = candidates.size();
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (losses[i] > minLoss + config_.tieEpsilon) continue;
            if (best == candidates.size()) {
                best = i;
                continue;
            }
            const SelectorCandidate& a = candidates[i];
            const SelectorCandidate& b = candidates[best];
            bool prefer = false;
            if (config_.tieBreak == TieBreak::FIT_TIME && a.fitSeconds != b.fitSeconds) {
                prefer = a.fitSeconds < b.fitSeconds;
            } else if (a.insertionOrder != b.insertionOrder) {
                prefer = a.insertionOrder < b.insertionOrder;
            } else {
                prefer = a.modelIndex < b.modelIndex;
            }
            if (prefer) best = i;
        }

        if (!result.trace.empty() && !(currentLoss - losses[best] > config_.tolerance)) break;

        const PredictionMatrix& chosen = *candidates[best].oof;
        for (size_t r = 0; r < rows; ++r) {
            for (size_t c = 0; c < width; ++c) sum[r][c] += chosen[r][c];
        }
        currentLoss = losses[best];
        ++counts[candidates[best].modelIndex];
        result.trace.push_back(candidates[best].modelIndex);
    }

    const double total = static_cast<double>(result.trace.size());
    for (const auto& kv : counts) result.weights.emplace_back(kv.first, static_cast<double>(kv.second) / total);
    result.validationLoss = currentLoss;
    result.roundsUsed = static_cast<int>(result.trace.size());
    return result;
}
