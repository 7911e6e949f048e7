#include <catch2/catch.hpp>

#include "Metrics.h"
#include "StackLayerBuilder.h"
#include "StrataExceptions.h"
#include "TestData.h"

#include <algorithm>

using TestData::ScriptedFamily;

namespace {
using Mode = ScriptedFamily::Mode;

CandidateConfig candidate(const std::string& name, const std::string& family, double estimateSeconds = 1e-4) {
    CandidateConfig c;
    c.name = name;
    c.family = family;
    c.estimate.fitSeconds = estimateSeconds;
    return c;
}

ResourceSnapshot snapshot(int cpus = 4, int gpus = 0) {
    ResourceSnapshot s;
    s.cpus = cpus;
    s.gpus = gpus;
    return s;
}

LayerSettings quietSettings() {
    LayerSettings s;
    s.verbose = false;
    s.graceSeconds = 0.0;
    return s;
}

// Everything one layer build needs, wired for regression on linearDataset().
struct LayerHarness {
    explicit LayerHarness(size_t rows = 40, double budget = 60.0, ResourceSnapshot snap = snapshot())
        : data(TestData::linearDataset(rows)),
          folds(FoldAssignment::make(data.labels(), 5, 1, false, 1337)),
          tracker(budget, snap),
          gpus(snap.gpus),
          metric(Metrics::byName("rmse", ProblemType::REGRESSION)),
          registry(Leaderboard(metric.name, metric.higherIsBetter), std::make_shared<InMemoryArtifactStore>()) {
        prototype.problemType = ProblemType::REGRESSION;
    }

    void add(const std::string& id, Mode mode, std::shared_ptr<TestData::FamilyCounters> counters = nullptr) {
        if (!counters) counters = std::make_shared<TestData::FamilyCounters>();
        families.registerFamily(id, std::make_shared<ScriptedFamily>(mode, counters));
    }

    LayerOutput build(size_t layer,
                      const std::vector<CandidateConfig>& candidates,
                      const std::vector<size_t>& previous = {},
                      LayerSettings settings = quietSettings()) {
        const StackLayerBuilder builder(families, weights, tracker, gpus, metric, settings);
        return builder.build(layer, data, folds, candidates, previous, registry, prototype);
    }

    Dataset data;
    FoldAssignment folds;
    FamilyRegistry families;
    const WeightsProvider* weights = nullptr;
    ResourceTracker tracker;
    GpuSlotPool gpus;
    EvalMetric metric;
    ModelRegistry registry;
    FitContext prototype;
};

const CandidateFailure* failureOf(const LayerOutput& out, const std::string& name) {
    for (const auto& f : out.failures) {
        if (f.candidate == name) return &f;
    }
    return nullptr;
}
} // namespace

TEST_CASE("out-of-fold predictions never see their own row", "[layer]") {
    LayerHarness h;
    h.add("memorize", Mode::MEMORIZE);
    const LayerOutput out = h.build(0, {candidate("Memo", "memorize")});

    REQUIRE(out.models.size() == 1);
    const auto model = h.registry.get(out.models[0]);
    REQUIRE(model->oof.size() == h.data.rowCount());
    for (const auto& row : model->oof) CHECK(row[0] == ScriptedFamily::kUnseen);
    CHECK(model->foldArtifacts.size() == 5);
    CHECK(model->name == "Memo_BAG_L1");
}

TEST_CASE("repeated bagging averages the out-of-fold predictions of every repeat", "[layer]") {
    LayerHarness h;
    h.folds = FoldAssignment::make(h.data.labels(), 4, 3, false, 99);
    h.add("mean", Mode::CONSTANT_MEAN);
    const LayerOutput out = h.build(0, {candidate("Mean", "mean")});

    REQUIRE(out.models.size() == 1);
    const auto model = h.registry.get(out.models[0]);
    CHECK(model->foldArtifacts.size() == 12);

    for (size_t row = 0; row < h.data.rowCount(); ++row) {
        double expected = 0.0;
        for (int r = 0; r < 3; ++r) {
            const auto& train = h.folds.trainingRows(r, h.folds.foldOf(r, row));
            double sum = 0.0;
            for (size_t t : train) sum += h.data.labels()[t];
            expected += sum / static_cast<double>(train.size()) / 3.0;
        }
        CHECK(model->oof[row][0] == Approx(expected));
    }
}

TEST_CASE("candidate failures are isolated and classified", "[layer]") {
    LayerHarness h;
    h.add("mean", Mode::CONSTANT_MEAN);
    h.add("diverge", Mode::THROW_NUMERICAL);
    h.add("oom", Mode::THROW_BAD_ALLOC);
    h.add("broken", Mode::THROW_GENERIC);

    const LayerOutput out = h.build(0, {
        candidate("Good", "mean"),
        candidate("Diverges", "diverge"),
        candidate("Hungry", "oom"),
        candidate("Broken", "broken"),
        candidate("Ghost", "no-such-family"),
    });

    REQUIRE(out.models.size() == 1);
    CHECK(h.registry.get(out.models[0])->name == "Good_BAG_L1");
    REQUIRE(out.failures.size() == 4);
    CHECK(failureOf(out, "Diverges")->kind == CandidateFailure::Kind::NUMERICAL);
    CHECK(failureOf(out, "Hungry")->kind == CandidateFailure::Kind::OUT_OF_MEMORY);
    CHECK(failureOf(out, "Broken")->kind == CandidateFailure::Kind::FIT_ERROR);
    CHECK(failureOf(out, "Ghost")->kind == CandidateFailure::Kind::UNKNOWN_FAMILY);
    CHECK(out.failures.front().candidate == "Diverges");
    CHECK_FALSE(out.budgetExhausted);
    CHECK(h.registry.size() == 1);
    CHECK(h.registry.leaderboard().size() == 1);
}

TEST_CASE("missing pretrained weights exclude the candidate", "[layer]") {
    LayerHarness h;
    h.add("mean", Mode::CONSTANT_MEAN);
    CandidateConfig foundation = candidate("Foundation", "mean");
    foundation.requiresExternalWeights = true;
    foundation.weightsId = "absent-weights";

    const LayerOutput withoutProvider = h.build(0, {foundation});
    CHECK(withoutProvider.models.empty());
    REQUIRE(withoutProvider.failures.size() == 1);
    CHECK(withoutProvider.failures[0].kind == CandidateFailure::Kind::MISSING_DEPENDENCY);

    TestData::TempDir cache;
    const DirectoryWeightsProvider provider(cache.path().string());
    h.weights = &provider;
    CHECK(h.build(0, {foundation}).failures.at(0).kind == CandidateFailure::Kind::MISSING_DEPENDENCY);

    cache.write("absent-weights", "temperature: 1\n");
    const LayerOutput resolved = h.build(0, {foundation});
    CHECK(resolved.failures.empty());
    CHECK(resolved.models.size() == 1);
}

TEST_CASE("a candidate that overruns its deadline is cancelled", "[layer]") {
    LayerHarness h;
    h.add("sleepy", Mode::SLEEP_PAST_DEADLINE);
    h.add("mean", Mode::CONSTANT_MEAN);
    LayerSettings settings = quietSettings();
    settings.maxTimeLimit = 0.2;

    const LayerOutput out = h.build(0, {candidate("Sleepy", "sleepy"), candidate("Mean", "mean")}, {}, settings);
    REQUIRE(failureOf(out, "Sleepy") != nullptr);
    CHECK(failureOf(out, "Sleepy")->kind == CandidateFailure::Kind::TIME_LIMIT);
    CHECK(out.models.size() == 1);
}

TEST_CASE("candidates whose estimate exceeds the remaining budget are skipped", "[layer]") {
    LayerHarness h(40, 10.0);
    auto counters = std::make_shared<TestData::FamilyCounters>();
    h.add("mean", Mode::CONSTANT_MEAN, counters);

    const LayerOutput out = h.build(0, {candidate("Expensive", "mean", 100.0), candidate("Cheap", "mean")});
    REQUIRE(out.failures.size() == 1);
    CHECK(out.failures[0].candidate == "Expensive");
    CHECK(out.failures[0].kind == CandidateFailure::Kind::BUDGET_SKIPPED);
    CHECK(out.models.size() == 1);
    CHECK(counters->fitCalls.load() == 5);
}

TEST_CASE("an exhausted budget admits no candidate", "[layer]") {
    const auto t0 = ResourceTracker::Clock::now();
    auto offset = std::make_shared<double>(0.0);
    const ResourceTracker tracker(5.0, snapshot(), [t0, offset] {
        return t0 + std::chrono::duration_cast<ResourceTracker::Clock::duration>(std::chrono::duration<double>(*offset));
    });
    *offset = 6.0;

    LayerHarness h;
    auto counters = std::make_shared<TestData::FamilyCounters>();
    h.add("mean", Mode::CONSTANT_MEAN, counters);
    const StackLayerBuilder builder(h.families, nullptr, tracker, h.gpus, h.metric, quietSettings());
    const LayerOutput out = builder.build(0, h.data, h.folds, {candidate("A", "mean"), candidate("B", "mean")}, {},
                                          h.registry, h.prototype);

    CHECK(out.models.empty());
    CHECK(out.budgetExhausted);
    REQUIRE(out.failures.size() == 2);
    for (const auto& f : out.failures) CHECK(f.kind == CandidateFailure::Kind::BUDGET_SKIPPED);
    CHECK(counters->fitCalls.load() == 0);
}

TEST_CASE("stack layers read the previous layer's out-of-fold columns", "[layer]") {
    LayerHarness h;
    auto counters = std::make_shared<TestData::FamilyCounters>();
    h.add("mean", Mode::CONSTANT_MEAN, counters);

    CandidateConfig baseOnly = candidate("BaseOnly", "mean");
    baseOnly.allowInStackLayers = false;
    const LayerOutput first = h.build(0, {candidate("A", "mean"), candidate("B", "mean"), baseOnly});
    REQUIRE(first.models.size() == 3);
    CHECK(counters->lastFeatureCount.load() == 2);

    const std::vector<size_t> previous = {first.models[0], first.models[1]};
    const LayerOutput second = h.build(1, {candidate("A", "mean"), baseOnly}, previous);
    REQUIRE(second.models.size() == 1);
    CHECK(second.failures.empty());
    CHECK(counters->lastFeatureCount.load() == 4);

    const auto stacked = h.registry.get(second.models[0]);
    CHECK(stacked->name == "A_BAG_L2");
    CHECK(stacked->layer == 1);
    CHECK(stacked->inputModels == previous);
    CHECK(stacked->keepOriginalFeatures);
    CHECK(h.registry.layerModels(1) == second.models);

    LayerSettings predictionsOnly = quietSettings();
    predictionsOnly.useOriginalFeatures = false;
    const LayerOutput third = h.build(1, {candidate("C", "mean")}, previous, predictionsOnly);
    REQUIRE(third.models.size() == 1);
    CHECK(counters->lastFeatureCount.load() == 2);
    CHECK_FALSE(h.registry.get(third.models[0])->keepOriginalFeatures);
}

TEST_CASE("stacked rows and names follow the input order", "[layer]") {
    const FeatureMatrix original = {{1.0, 2.0}, {3.0, 4.0}};
    const PredictionMatrix a = {{0.1}, {0.2}};
    const PredictionMatrix b = {{0.7}, {0.8}};

    const FeatureMatrix kept = StackLayerBuilder::stackRows(original, {&a, &b}, true);
    CHECK(kept[1] == std::vector<double>{3.0, 4.0, 0.2, 0.8});
    const FeatureMatrix dropped = StackLayerBuilder::stackRows(original, {&a, &b}, false);
    CHECK(dropped[0] == std::vector<double>{0.1, 0.7});

    const PredictionMatrix shortBlock = {{0.1}};
    CHECK_THROWS_AS(StackLayerBuilder::stackRows(original, {&shortBlock}, true), Strata::DatasetException);

    CHECK(StackLayerBuilder::stackedNames({"x"}, {"A_BAG_L1", "B_BAG_L1"}, 2, true)
          == std::vector<std::string>{"x", "A_BAG_L1_p0", "A_BAG_L1_p1", "B_BAG_L1_p0", "B_BAG_L1_p1"});
    CHECK(StackLayerBuilder::modelName("NeuralNet", 0) == "NeuralNet_BAG_L1");
}

TEST_CASE("layer builds reject inconsistent inputs", "[layer]") {
    LayerHarness h;
    h.add("mean", Mode::CONSTANT_MEAN);
    h.folds = FoldAssignment::make(std::vector<double>(10, 0.0), 5, 1, false, 1);
    CHECK_THROWS_AS(h.build(0, {candidate("A", "mean")}), Strata::DatasetException);

    LayerHarness fresh;
    fresh.add("mean", Mode::CONSTANT_MEAN);
    CHECK_THROWS_AS(fresh.build(1, {candidate("A", "mean")}), Strata::StrataException);
}

TEST_CASE("refit produces a full-data artifact used for inference", "[layer]") {
    LayerHarness h;
    h.add("mean", Mode::CONSTANT_MEAN);
    LayerSettings settings = quietSettings();
    settings.refitFull = true;

    const LayerOutput out = h.build(0, {candidate("Mean", "mean")}, {}, settings);
    REQUIRE(out.models.size() == 1);
    const auto model = h.registry.get(out.models[0]);
    REQUIRE(model->refitArtifact);

    double mean = 0.0;
    for (double y : h.data.labels()) mean += y;
    mean /= static_cast<double>(h.data.rowCount());
    CHECK(model->predict({{0.0, 0.0}})[0][0] == Approx(mean));
    CHECK(model->validationScore > 0.0);
    CHECK(model->memoryBytes > 0);
}

TEST_CASE("exclusive GPU candidates never share a device", "[layer]") {
    LayerHarness h(40, 60.0, snapshot(4, 1));
    auto counters = std::make_shared<TestData::FamilyCounters>();
    h.add("slow", Mode::SLOW, counters);

    std::vector<CandidateConfig> candidates;
    for (const char* name : {"G1", "G2", "G3"}) {
        CandidateConfig c = candidate(name, "slow");
        c.requiresGpu = true;
        candidates.push_back(c);
    }
    const LayerOutput out = h.build(0, candidates);
    CHECK(out.models.size() == 3);
    CHECK(counters->maxActive.load() == 1);
    CHECK(h.gpus.available() == 1);
}

TEST_CASE("GPU candidates without a device time out", "[layer]") {
    LayerHarness h;
    h.add("mean", Mode::CONSTANT_MEAN);
    CandidateConfig c = candidate("NeedsGpu", "mean");
    c.requiresGpu = true;
    const LayerOutput out = h.build(0, {c});
    REQUIRE(out.failures.size() == 1);
    CHECK(out.failures[0].kind == CandidateFailure::Kind::TIME_LIMIT);
}

TEST_CASE("failure kinds have stable names", "[layer]") {
    CHECK(failureKindName(CandidateFailure::Kind::MISSING_DEPENDENCY) == "missing_dependency");
    CHECK(failureKindName(CandidateFailure::Kind::BUDGET_SKIPPED) == "budget_skipped");
    CHECK(failureKindName(CandidateFailure::Kind::OUT_OF_MEMORY) == "out_of_memory");
}
