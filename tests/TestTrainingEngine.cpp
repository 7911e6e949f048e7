#include <catch2/catch.hpp>

#include "LeaderboardExport.h"
#include "StrataExceptions.h"
#include "TestData.h"
#include "TrainingEngine.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>

using TestData::ScriptedFamily;

namespace {
AutoConfig baseConfig() {
    AutoConfig cfg;
    cfg.labelColumn = "target";
    cfg.timeLimit = 60.0;
    cfg.numCpus = 2;
    cfg.numGpus = 0;
    cfg.verbose = false;
    return cfg;
}

Portfolio::Entry entry(const std::string& name, const std::string& family) {
    Portfolio::Entry e;
    e.name = name;
    e.family = family;
    return e;
}

double columnStdDev(const TabularData& data, const std::string& column) {
    const auto& values = std::get<std::vector<double>>(data.columns()[static_cast<size_t>(data.findColumnIndex(column))].values);
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= static_cast<double>(values.size());
    double ss = 0.0;
    for (double v : values) ss += (v - mean) * (v - mean);
    return std::sqrt(ss / static_cast<double>(values.size()));
}

bool hasNote(const FitSummary& summary, const std::string& text) {
    return std::find(summary.notes.begin(), summary.notes.end(), text) != summary.notes.end();
}
} // namespace

TEST_CASE("binary classification end to end", "[engine]") {
    const TabularData train = TestData::binaryTable(150);
    const TrainingEngine engine(baseConfig());
    const Predictor predictor = engine.fit(train);
    const FitSummary& s = predictor.summary();

    CHECK(s.problemType == ProblemType::BINARY);
    CHECK(s.metricName == "log_loss");
    CHECK(s.preset == "medium_quality");
    CHECK(s.folds == 5);
    CHECK(s.trainRows == 150);
    CHECK(predictor.classLabels() == std::vector<std::string>{"no", "yes"});
    CHECK(predictor.leaderboard().size() >= 1);

    double total = 0.0;
    for (const auto& w : predictor.ensembleWeights().weights) total += w.second;
    CHECK(total == Approx(1.0));

    const PredictionMatrix proba = predictor.predictProba(train);
    REQUIRE(proba.size() == train.rowCount());
    for (const auto& row : proba) {
        REQUIRE(row.size() == 2);
        CHECK(row[0] + row[1] == Approx(1.0));
    }

    const std::vector<std::string> labels = predictor.predictLabels(train);
    const auto& truth = std::get<std::vector<std::string>>(train.columns()[2].values);
    size_t hits = 0;
    for (size_t i = 0; i < labels.size(); ++i) hits += labels[i] == truth[i];
    CHECK(static_cast<double>(hits) / static_cast<double>(labels.size()) > 0.8);

    CHECK_THROWS_AS(predictor.predictQuantiles(train), Strata::ConfigurationException);
}

TEST_CASE("regression end to end beats the constant baseline", "[engine]") {
    const TabularData train = TestData::regressionTable(150);
    const TrainingEngine engine(baseConfig());
    const Predictor predictor = engine.fit(train);

    CHECK(predictor.summary().problemType == ProblemType::REGRESSION);
    CHECK(predictor.summary().metricName == "rmse");
    CHECK(predictor.summary().ensembleScore < 0.5 * columnStdDev(train, "target"));
    CHECK(predictor.predict(train).size() == train.rowCount());
    CHECK_THROWS_AS(predictor.predictProba(train), Strata::ConfigurationException);

    const ExportTable oof = LeaderboardExport::oofTable(predictor);
    CHECK(oof.rowCount() == train.rowCount());
    CHECK(oof.columns[1].name == "ensemble_p0");
}

TEST_CASE("quantile regression returns ordered quantiles including the median", "[engine]") {
    AutoConfig cfg = baseConfig();
    cfg.problemType = "quantile";
    cfg.quantileLevels = {0.9, 0.1};
    const TabularData train = TestData::regressionTable(120);
    const Predictor predictor = TrainingEngine(cfg).fit(train);

    CHECK(predictor.summary().metricName == "pinball");
    CHECK(predictor.quantileLevels() == std::vector<double>{0.1, 0.5, 0.9});
    const PredictionMatrix q = predictor.predictQuantiles(train);
    REQUIRE(q.size() == train.rowCount());
    for (const auto& row : q) {
        REQUIRE(row.size() == 3);
        CHECK(std::is_sorted(row.begin(), row.end()));
    }

    const ExportTable table = LeaderboardExport::predictionTable(predictor, train);
    REQUIRE(table.columns.size() == 4);
    CHECK(table.columns[1].name == "q0.1");
    CHECK(table.columns[3].name == "q0.9");
}

TEST_CASE("multiclass labels are inferred and predicted", "[engine]") {
    TabularData data;
    std::vector<double> x;
    std::vector<std::string> y;
    for (int i = 0; i < 90; ++i) {
        x.push_back(static_cast<double>(i % 30));
        y.push_back(i % 30 < 10 ? "low" : (i % 30 < 20 ? "mid" : "high"));
    }
    data.addNumericColumn("x", x);
    data.addCategoricalColumn("target", y);

    const Predictor predictor = TrainingEngine(baseConfig()).fit(data);
    CHECK(predictor.summary().problemType == ProblemType::MULTICLASS);
    CHECK(predictor.summary().numClasses == 3);
    const PredictionMatrix proba = predictor.predictProba(data);
    REQUIRE(proba.front().size() == 3);
    for (const auto& row : proba) {
        double sum = 0.0;
        for (double p : row) sum += p;
        CHECK(sum == Approx(1.0).epsilon(1e-6));
    }
}

TEST_CASE("fatal configuration errors are raised before any model is trained", "[engine]") {
    auto counters = std::make_shared<TestData::FamilyCounters>();
    FamilyRegistry families;
    families.registerFamily("mean", std::make_shared<ScriptedFamily>(ScriptedFamily::Mode::CONSTANT_MEAN, counters));
    const TabularData train = TestData::regressionTable(40);

    SECTION("non-positive time limit") {
        AutoConfig cfg = baseConfig();
        cfg.timeLimit = 0.0;
        TrainingEngine engine(cfg, families);
        engine.setPortfolioEntries({entry("Mean", "mean")});
        CHECK_THROWS_AS(engine.fit(train), Strata::ConfigurationException);
    }
    SECTION("label column absent") {
        AutoConfig cfg = baseConfig();
        cfg.labelColumn = "price";
        TrainingEngine engine(cfg, families);
        engine.setPortfolioEntries({entry("Mean", "mean")});
        CHECK_THROWS_AS(engine.fit(train), Strata::ConfigurationException);
    }
    SECTION("empty training data") {
        TrainingEngine engine(baseConfig(), families);
        engine.setPortfolioEntries({entry("Mean", "mean")});
        CHECK_THROWS_AS(engine.fit(TabularData{}), Strata::DatasetException);
    }
    SECTION("metric incompatible with the problem") {
        AutoConfig cfg = baseConfig();
        cfg.evalMetric = "accuracy";
        TrainingEngine engine(cfg, families);
        engine.setPortfolioEntries({entry("Mean", "mean")});
        CHECK_THROWS_AS(engine.fit(train), Strata::ConfigurationException);
    }
    CHECK(counters->fitCalls.load() == 0);
}

TEST_CASE("GPU-only candidates are left out without failures on CPU machines", "[engine]") {
    Portfolio::Entry gpuOnly = entry("NeuralNetGPU", "mlp");
    gpuOnly.requiresGpu = true;
    TrainingEngine engine(baseConfig());
    engine.setPortfolioEntries({gpuOnly, entry("LinearModel", "linear"), entry("Baseline", "constant")});

    const Predictor predictor = engine.fit(TestData::regressionTable(80));
    CHECK(hasNote(predictor.summary(), "No GPU detected; excluded GPU-only candidate(s): NeuralNetGPU"));
    CHECK_FALSE(predictor.leaderboard().find("NeuralNetGPU_BAG_L1").has_value());
    for (const auto& f : predictor.summary().failures) CHECK(f.candidate != "NeuralNetGPU");
}

TEST_CASE("a fit where every candidate fails reports each failure", "[engine]") {
    FamilyRegistry families;
    families.registerFamily("diverge", std::make_shared<ScriptedFamily>(ScriptedFamily::Mode::THROW_NUMERICAL));
    TrainingEngine engine(baseConfig(), families);
    engine.setPortfolioEntries({entry("Unstable", "diverge"), entry("Phantom", "phantom")});

    try {
        (void)engine.fit(TestData::regressionTable(40));
        FAIL("fit should have failed");
    } catch (const Strata::FitFailedException& ex) {
        const std::string what = ex.what();
        CHECK(what.find("no model could be fitted") != std::string::npos);
        CHECK(what.find("Unstable_BAG_L1 [numerical]") != std::string::npos);
        CHECK(what.find("Phantom_BAG_L1 [unknown_family]") != std::string::npos);
    }
}

TEST_CASE("one bad candidate does not sink the fit", "[engine]") {
    FamilyRegistry families = FamilyRegistry::builtin();
    families.registerFamily("diverge", std::make_shared<ScriptedFamily>(ScriptedFamily::Mode::THROW_NUMERICAL));
    TrainingEngine engine(baseConfig(), families);
    engine.setPortfolioEntries({entry("Unstable", "diverge"), entry("LinearModel", "linear")});

    const Predictor predictor = engine.fit(TestData::regressionTable(60));
    REQUIRE(predictor.summary().failures.size() == 1);
    CHECK(predictor.summary().failures[0].kind == CandidateFailure::Kind::NUMERICAL);
    CHECK(predictor.ensembleWeights().weightOf(predictor.leaderboard().find("LinearModel_BAG_L1")->modelIndex) == Approx(1.0));
}

TEST_CASE("stacking keeps a second layer only when it does not degrade", "[engine]") {
    AutoConfig cfg = baseConfig();
    cfg.maxLayers = 2;
    TrainingEngine engine(cfg);
    engine.setPortfolioEntries({entry("LinearModel", "linear"), entry("DecisionTree", "tree"), entry("Baseline", "constant")});

    const TabularData train = TestData::regressionTable(120);
    const Predictor predictor = engine.fit(train);
    const FitSummary& s = predictor.summary();
    CHECK(s.layersBuilt >= 1);
    CHECK(s.layersBuilt <= 2);

    const auto best0 = predictor.leaderboard().bestInLayer(0);
    REQUIRE(best0.has_value());
    if (s.finalLayer == 1) {
        const auto best1 = predictor.leaderboard().bestInLayer(1);
        REQUIRE(best1.has_value());
        CHECK(best1->validationScore <= best0->validationScore);
        for (size_t idx : predictor.ensembleWeights().support()) CHECK(predictor.registry().layerOf(idx) == 1);
    } else {
        for (size_t idx : predictor.ensembleWeights().support()) CHECK(predictor.registry().layerOf(idx) == 0);
    }

    // Everything outside the ensemble's dependency closure is released.
    const auto& keep = predictor.evaluationOrder();
    for (size_t i = 0; i < predictor.registry().size(); ++i) {
        const bool needed = std::find(keep.begin(), keep.end(), i) != keep.end();
        CHECK(predictor.registry().isReleased(i) == !needed);
    }
    CHECK(predictor.predict(train).size() == train.rowCount());
}

TEST_CASE("a stack layer without surviving models keeps the previous layer", "[engine][stacking]") {
    FamilyRegistry families;
    families.registerFamily("broken", std::make_shared<ScriptedFamily>(ScriptedFamily::Mode::THROW_GENERIC));
    families.registerFamily("mean", std::make_shared<ScriptedFamily>(ScriptedFamily::Mode::CONSTANT_MEAN));
    AutoConfig cfg = baseConfig();
    cfg.maxLayers = 3;
    Portfolio::Entry baseOnly = entry("Mean", "mean");
    baseOnly.allowInStackLayers = false;
    TrainingEngine engine(cfg, families);
    engine.setPortfolioEntries({entry("Broken", "broken"), baseOnly});

    const TabularData train = TestData::regressionTable(60);
    const Predictor predictor = engine.fit(train);
    const FitSummary& s = predictor.summary();
    CHECK(s.finalLayer == 0);
    CHECK(s.layersBuilt == 2);
    CHECK(s.haltReason == "layer 2 produced no models");
    REQUIRE(s.failures.size() == 2);
    CHECK(s.failures[0].candidate == "Broken");
    CHECK(s.failures[0].layer == 0);
    CHECK(s.failures[1].candidate == "Broken");
    CHECK(s.failures[1].layer == 1);
    CHECK(predictor.leaderboard().find("Mean_BAG_L1").has_value());
    for (size_t idx : predictor.ensembleWeights().support()) CHECK(predictor.registry().layerOf(idx) == 0);
    CHECK(predictor.predict(train).size() == train.rowCount());
}

TEST_CASE("stacking halts when the next layer scores worse", "[engine][stacking]") {
    FamilyRegistry families;
    families.registerFamily("drift", std::make_shared<ScriptedFamily>(ScriptedFamily::Mode::WORSE_WHEN_STACKED));
    AutoConfig cfg = baseConfig();
    cfg.maxLayers = 3;
    TrainingEngine engine(cfg, families);
    engine.setPortfolioEntries({entry("Drift", "drift")});

    const TabularData train = TestData::regressionTable(60);
    const Predictor predictor = engine.fit(train);
    const FitSummary& s = predictor.summary();
    CHECK(s.finalLayer == 0);
    CHECK(s.layersBuilt == 2);
    CHECK(s.haltReason == "layer 2 did not improve on layer 1");
    CHECK(s.failures.empty());

    const auto best0 = predictor.leaderboard().bestInLayer(0);
    REQUIRE(best0.has_value());
    CHECK(best0->modelName == "Drift_BAG_L1");
    const auto support = predictor.ensembleWeights().support();
    REQUIRE(support.size() == 1);
    CHECK(support[0] == best0->modelIndex);
    CHECK(predictor.predict(train).size() == train.rowCount());
}

TEST_CASE("a fit stays within its time limit plus one grace period", "[engine][budget]") {
    using ScriptedMode = ScriptedFamily::Mode;
    FamilyRegistry families;
    families.registerFamily("mean", std::make_shared<ScriptedFamily>(ScriptedMode::CONSTANT_MEAN));
    families.registerFamily("slow", std::make_shared<ScriptedFamily>(ScriptedMode::SLOW));
    families.registerFamily("stuck", std::make_shared<ScriptedFamily>(ScriptedMode::SLEEP_PAST_DEADLINE));
    AutoConfig cfg = baseConfig();
    cfg.timeLimit = 0.5;
    cfg.graceSeconds = 0.1;
    cfg.maxLayers = 2;
    TrainingEngine engine(cfg, families);
    engine.setPortfolioEntries({entry("Mean", "mean"), entry("SlowA", "slow"), entry("SlowB", "slow"),
                                entry("StuckA", "stuck"), entry("StuckB", "stuck"), entry("StuckC", "stuck")});

    const auto started = std::chrono::steady_clock::now();
    const Predictor predictor = engine.fit(TestData::regressionTable(60));
    const double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    const FitSummary& s = predictor.summary();

    const double bound = cfg.timeLimit + cfg.graceSeconds;
    CHECK(s.elapsedSeconds <= bound + 0.25);
    CHECK(wall <= bound + 0.5);
    CHECK(predictor.leaderboard().find("Mean_BAG_L1").has_value());
    size_t stopped = 0;
    for (const auto& f : s.failures) {
        CHECK(f.candidate != "Mean");
        if (f.candidate.rfind("Stuck", 0) == 0) {
            CHECK((f.kind == CandidateFailure::Kind::TIME_LIMIT || f.kind == CandidateFailure::Kind::BUDGET_SKIPPED));
            ++stopped;
        }
    }
    CHECK(stopped >= 3);
}

TEST_CASE("predicting a table without a training feature fails", "[engine]") {
    TrainingEngine engine(baseConfig());
    engine.setPortfolioEntries({entry("LinearModel", "linear")});
    const Predictor predictor = engine.fit(TestData::regressionTable(50));

    TabularData partial;
    partial.addNumericColumn("x1", {1.0, 2.0});
    CHECK_THROWS_AS(predictor.predict(partial), Strata::DatasetException);
}

TEST_CASE("problem type hints and quantile levels resolve", "[engine]") {
    TypedColumn label;
    label.name = "y";
    label.type = ColumnType::NUMERIC;
    label.values = std::vector<double>{0.5, 1.5, 2.25, 3.75};
    label.missing.assign(4, 0);

    CHECK(TrainingEngine::resolveProblemType("auto", label) == ProblemType::REGRESSION);
    CHECK(TrainingEngine::resolveProblemType("Quantile", label) == ProblemType::QUANTILE);
    CHECK_THROWS_AS(TrainingEngine::resolveProblemType("ranking", label), Strata::ConfigurationException);
    CHECK(TrainingEngine::modelQuantileLevels({0.9, 0.1, 0.5}) == std::vector<double>{0.1, 0.5, 0.9});
    CHECK(TrainingEngine::modelQuantileLevels({0.25}) == std::vector<double>{0.25, 0.5});
    CHECK(TrainingEngine::failureReport({}).find("no candidate was admitted") != std::string::npos);
}
