#include "StackLayerBuilder.h"
#include "CommonUtils.h"
#include "FamilyUtils.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <new>
#include <optional>
#include <sstream>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr size_t kPredictTimingRows = 200;

void logLine(const std::string& line, bool toStderr = false) {
    #ifdef USE_OPENMP
    #pragma omp critical(strata_log)
    #endif
    {
        (toStderr ? std::cerr : std::cout) << line << "\n";
    }
}

std::string layerTag(size_t layer) {
    return "[Strata][Layer " + std::to_string(layer + 1) + "] ";
}

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}
} // namespace

struct StackLayerBuilder::TaskResult {
    std::shared_ptr<const FittedModel> model;
    std::optional<CandidateFailure> failure;
};

std::string failureKindName(CandidateFailure::Kind kind) {
    switch (kind) {
        case CandidateFailure::Kind::FIT_ERROR: return "fit_error";
        case CandidateFailure::Kind::NUMERICAL: return "numerical";
        case CandidateFailure::Kind::OUT_OF_MEMORY: return "out_of_memory";
        case CandidateFailure::Kind::MISSING_DEPENDENCY: return "missing_dependency";
        case CandidateFailure::Kind::UNKNOWN_FAMILY: return "unknown_family";
        case CandidateFailure::Kind::TIME_LIMIT: return "time_limit";
        case CandidateFailure::Kind::BUDGET_SKIPPED: return "budget_skipped";
    }
    return "fit_error";
}

StackLayerBuilder::StackLayerBuilder(const FamilyRegistry& families,
                                     const WeightsProvider* weights,
                                     const ResourceTracker& tracker,
                                     GpuSlotPool& gpus,
                                     const EvalMetric& metric,
                                     LayerSettings settings)
    : families_(families),
      weights_(weights),
      tracker_(tracker),
      gpus_(gpus),
      metric_(metric),
      settings_(settings) {}

std::string StackLayerBuilder::modelName(const std::string& candidate, size_t layer) {
    return candidate + "_BAG_L" + std::to_string(layer + 1);
}

FeatureMatrix StackLayerBuilder::stackRows(const FeatureMatrix& original,
                                           const std::vector<const PredictionMatrix*>& inputs,
                                           bool keepOriginal) {
    const size_t rows = original.size();
    for (const PredictionMatrix* block : inputs) {
        if (block == nullptr || block->size() != rows) {
            throw Strata::DatasetException("Stacked input block does not match the row count (" + std::to_string(rows) + ")");
        }
    }

    FeatureMatrix out(rows);
    for (size_t r = 0; r < rows; ++r) {
        std::vector<double>& row = out[r];
        if (keepOriginal) row = original[r];
        for (const PredictionMatrix* block : inputs) {
            const auto& cols = (*block)[r];
            row.insert(row.end(), cols.begin(), cols.end());
        }
    }
    return out;
}

std::vector<std::string> StackLayerBuilder::stackedNames(const std::vector<std::string>& original,
                                                         const std::vector<std::string>& inputModelNames,
                                                         size_t width,
                                                         bool keepOriginal) {
    std::vector<std::string> names;
    if (keepOriginal) names = original;
    for (const auto& model : inputModelNames) {
        for (size_t j = 0; j < width; ++j) names.push_back(model + "_p" + std::to_string(j));
    }
    return names;
}

Clock::time_point StackLayerBuilder::candidateDeadline() const {
    using Seconds = std::chrono::duration<double>;
    double share = tracker_.remainingTime() * settings_.maxTimeLimitRatio;
    if (settings_.maxTimeLimit > 0.0) share = std::min(share, settings_.maxTimeLimit);

    Clock::time_point end = Clock::now() + std::chrono::duration_cast<Clock::duration>(Seconds(share));
    end = std::min(end, tracker_.budgetEnd());
    return end + std::chrono::duration_cast<Clock::duration>(Seconds(settings_.graceSeconds));
}

StackLayerBuilder::TaskResult StackLayerBuilder::trainCandidate(const CandidateConfig& config,
                                                                size_t layer,
                                                                const Dataset& data,
                                                                const FoldAssignment& folds,
                                                                const std::vector<size_t>& inputs,
                                                                const FitContext& prototype,
                                                                int threads) const {
    TaskResult result;
    const std::string name = modelName(config.name, layer);
    auto fail = [&](CandidateFailure::Kind kind, const std::string& reason) {
        CandidateFailure f;
        f.candidate = config.name;
        f.layer = layer;
        f.kind = kind;
        f.reason = reason;
        result.failure = std::move(f);
    };

    const auto started = Clock::now();
    try {
        if (tracker_.remainingTime() < settings_.minModelCostSeconds) {
            fail(CandidateFailure::Kind::BUDGET_SKIPPED, "budget exhausted before the candidate started");
            return result;
        }
        std::shared_ptr<const ModelFamily> family = families_.find(config.family);
        if (!family) {
            fail(CandidateFailure::Kind::UNKNOWN_FAMILY, "unknown model family '" + config.family + "'");
            return result;
        }

        FitContext ctx = prototype;
        ctx.candidateName = name;
        ctx.numThreads = threads;
        ctx.deadline = candidateDeadline();

        if (config.requiresExternalWeights) {
            std::optional<WeightsHandle> handle;
            if (weights_ != nullptr) handle = weights_->acquire(config.weightsId);
            if (!handle) {
                throw Strata::MissingDependencyException("weights '" + config.weightsId + "' are not available for " + config.name);
            }
            ctx.weightsPath = handle->path;
        }

        GpuSlotPool::Lease lease;
        if (config.requiresGpu && !config.gpuShareable) {
            std::optional<GpuSlotPool::Lease> acquired = gpus_.acquireUntil(ctx.deadline);
            if (!acquired) throw Strata::TimeLimitExceeded(name + " found no free GPU before its deadline");
            lease = std::move(*acquired);
        }

        if (settings_.verbose) {
            std::ostringstream msg;
            msg << layerTag(layer) << "Fitting " << name << " (" << config.family << ", " << folds.folds() << " folds x "
                << folds.repeats() << ", threads=" << threads;
            if (lease.held()) msg << ", gpu=" << lease.device();
            msg << ")";
            logLine(msg.str());
        }

        auto model = std::make_shared<FittedModel>();
        model->name = name;
        model->config = config;
        model->family = family;
        model->layer = layer;
        model->inputModels = inputs;
        model->keepOriginalFeatures = layer == 0 || settings_.useOriginalFeatures;

        const size_t width = ctx.width();
        const double perRepeat = 1.0 / static_cast<double>(folds.repeats());
        model->oof.assign(data.rowCount(), std::vector<double>(width, 0.0));

        for (int r = 0; r < folds.repeats(); ++r) {
            for (int f = 0; f < folds.folds(); ++f) {
                ctx.checkDeadline();
                const std::vector<size_t>& valRows = folds.validationRows(r, f);
                FitOutput out = family->fit(data.subset(folds.trainingRows(r, f)),
                                            data.subset(valRows),
                                            config.hyperparameters,
                                            ctx);
                if (!out.artifact) throw Strata::CandidateException(name + ": family returned no artifact");
                if (out.valPredictions.size() != valRows.size()) {
                    throw Strata::NumericalException(name + ": fold " + std::to_string(f) + " returned "
                                                     + std::to_string(out.valPredictions.size()) + " predictions for "
                                                     + std::to_string(valRows.size()) + " rows");
                }
                for (size_t i = 0; i < valRows.size(); ++i) {
                    const auto& pred = out.valPredictions[i];
                    if (pred.size() != width) throw Strata::NumericalException(name + ": prediction width mismatch");
                    auto& target = model->oof[valRows[i]];
                    for (size_t c = 0; c < width; ++c) target[c] += pred[c] * perRepeat;
                }
                model->foldArtifacts.push_back(std::shared_ptr<const ModelArtifact>(std::move(out.artifact)));
            }
        }
        FamilyUtils::requireFinite(model->oof, name);

        if (settings_.refitFull) {
            ctx.checkDeadline();
            FitOutput full = family->fit(data, data.subset({}), config.hyperparameters, ctx);
            if (!full.artifact) throw Strata::CandidateException(name + ": family returned no refit artifact");
            model->refitArtifact = std::shared_ptr<const ModelArtifact>(std::move(full.artifact));
        }
        ctx.checkDeadline();
        lease.reset();

        model->validationScore = metric_.compute(data.labels(), model->oof, data.weights());
        if (!std::isfinite(model->validationScore)) {
            throw Strata::NumericalException(name + ": validation " + metric_.name + " is not finite");
        }
        model->fitSeconds = secondsSince(started);

        const size_t sampleRows = std::min(kPredictTimingRows, data.rowCount());
        const FeatureMatrix sample(data.features().begin(), data.features().begin() + static_cast<std::ptrdiff_t>(sampleRows));
        const auto predictStart = Clock::now();
        (void)model->predict(sample);
        model->predictSeconds = sampleRows == 0
            ? 0.0
            : secondsSince(predictStart) * static_cast<double>(data.rowCount()) / static_cast<double>(sampleRows);

        size_t bytes = model->oof.size() * width * sizeof(double);
        for (const auto& artifact : model->foldArtifacts) bytes += artifact->memoryBytes();
        if (model->refitArtifact) bytes += model->refitArtifact->memoryBytes();
        model->memoryBytes = bytes;

        result.model = std::move(model);
    } catch (const Strata::MissingDependencyException& ex) {
        fail(CandidateFailure::Kind::MISSING_DEPENDENCY, ex.what());
    } catch (const Strata::TimeLimitExceeded& ex) {
        fail(CandidateFailure::Kind::TIME_LIMIT, ex.what());
    } catch (const Strata::NumericalException& ex) {
        fail(CandidateFailure::Kind::NUMERICAL, ex.what());
    } catch (const std::bad_alloc&) {
        fail(CandidateFailure::Kind::OUT_OF_MEMORY, "out of memory");
    } catch (const std::exception& ex) {
        fail(CandidateFailure::Kind::FIT_ERROR, ex.what());
    }
    return result;
}

LayerOutput StackLayerBuilder::build(size_t layer,
                                     const Dataset& base,
                                     const FoldAssignment& folds,
                                     const std::vector<CandidateConfig>& candidates,
                                     const std::vector<size_t>& previous,
                                     ModelRegistry& registry,
                                     const FitContext& prototype) const {
    LayerOutput out;
    out.layer = layer;
    const std::string tag = layerTag(layer);

    if (folds.rowCount() != base.rowCount()) {
        throw Strata::DatasetException("Fold assignment covers " + std::to_string(folds.rowCount())
                                       + " rows but the layer input has " + std::to_string(base.rowCount()));
    }

    Dataset data = base;
    std::vector<size_t> inputs;
    if (layer > 0) {
        if (previous.empty()) throw Strata::StrataException("Layer " + std::to_string(layer + 1) + " has no input models");
        std::vector<std::shared_ptr<const FittedModel>> held;
        std::vector<const PredictionMatrix*> blocks;
        std::vector<std::string> names;
        for (size_t idx : previous) {
            held.push_back(registry.get(idx));
            blocks.push_back(&held.back()->oof);
            names.push_back(held.back()->name);
        }
        data = base.withFeatures(stackRows(base.features(), blocks, settings_.useOriginalFeatures),
                                 stackedNames(base.featureNames(), names, prototype.width(), settings_.useOriginalFeatures));
        inputs = previous;
    }

    std::vector<const CandidateConfig*> admitted;
    const double perFoldFactor = static_cast<double>(folds.folds() * folds.repeats()) + (settings_.refitFull ? 1.0 : 0.0);
    for (const auto& candidate : candidates) {
        if (layer > 0 && !candidate.allowInStackLayers) {
            if (settings_.verbose) logLine(tag + candidate.name + " is not used in stack layers");
            continue;
        }
        const double remaining = tracker_.remainingTime();
        CandidateFailure skip;
        skip.candidate = candidate.name;
        skip.layer = layer;
        skip.kind = CandidateFailure::Kind::BUDGET_SKIPPED;
        if (remaining < settings_.minModelCostSeconds) {
            out.budgetExhausted = true;
            skip.reason = "remaining budget " + CommonUtils::formatSeconds(remaining) + " is below the minimum model cost";
            out.failures.push_back(std::move(skip));
            continue;
        }
        const double cost = candidate.estimate.fitSeconds * perFoldFactor;
        if (cost > remaining) {
            skip.reason = "estimated cost " + CommonUtils::formatSeconds(cost) + " exceeds remaining budget "
                        + CommonUtils::formatSeconds(remaining);
            out.failures.push_back(std::move(skip));
            continue;
        }
        admitted.push_back(&candidate);
    }

    const int cpus = std::max(1, tracker_.availableParallelism().cpus);
    const int workers = std::max(1, std::min(cpus, static_cast<int>(admitted.size())));
    const int threadsPerTask = std::max(1, cpus / workers);
    if (settings_.verbose) {
        logLine(tag + "Training " + std::to_string(admitted.size()) + " candidate(s) on "
                + std::to_string(data.featureCount()) + " feature(s) with " + std::to_string(workers) + " worker(s)");
    }

    std::vector<TaskResult> slots(admitted.size());
    const long long n = static_cast<long long>(admitted.size());
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic) num_threads(workers)
    #endif
    for (long long i = 0; i < n; ++i) {
        slots[static_cast<size_t>(i)] = trainCandidate(*admitted[static_cast<size_t>(i)], layer, data, folds, inputs, prototype, threadsPerTask);
    }

    for (auto& slot : slots) {
        if (slot.model) {
            const std::string name = slot.model->name;
            const double score = slot.model->validationScore;
            const double seconds = slot.model->fitSeconds;
            const size_t index = registry.add(std::move(slot.model));
            out.models.push_back(index);
            if (settings_.verbose) {
                std::ostringstream msg;
                msg << tag << name << " " << metric_.name << "=" << std::setprecision(6) << score
                    << " fit=" << CommonUtils::formatSeconds(seconds);
                logLine(msg.str());
            }
            continue;
        }
        if (!slot.failure) continue;
        if (slot.failure->kind == CandidateFailure::Kind::BUDGET_SKIPPED) out.budgetExhausted = true;
        logLine("[Strata][Warning] " + modelName(slot.failure->candidate, layer) + " excluded ("
                + failureKindName(slot.failure->kind) + "): " + slot.failure->reason, true);
        out.failures.push_back(std::move(*slot.failure));
    }

    if (settings_.verbose) {
        logLine(tag + std::to_string(out.models.size()) + " model(s) fitted, " + std::to_string(out.failures.size())
                + " excluded");
    }
    return out;
}
