#include <catch2/catch.hpp>

#include "AutoConfig.h"
#include "StrataExceptions.h"
#include "TestData.h"

using Catch::Matchers::Contains;
using TestData::Args;

namespace {
AutoConfig labelled() {
    AutoConfig cfg;
    cfg.labelColumn = "target";
    return cfg;
}
} // namespace

TEST_CASE("set normalizes keys and parses typed values", "[config]") {
    AutoConfig cfg;
    cfg.set("--time-limit", "12.5");
    cfg.set("KFOLD", "4");
    cfg.set("-stack-use-original-features", "off");
    cfg.set("refit_full", "YES");
    cfg.set("preset", "Best");
    cfg.set("excluded-families", "MLP, knn");
    cfg.set("exclude", "id,  ts ");
    cfg.set("quantile_levels", "0.25, 0.75");
    cfg.set("seed", "42");
    cfg.set("delimiter", "tab");
    cfg.set("num_gpus", "-1");

    CHECK(cfg.timeLimit == Approx(12.5));
    CHECK(cfg.kfold == 4);
    CHECK_FALSE(cfg.stackUseOriginalFeatures);
    CHECK(cfg.refitFull);
    CHECK(cfg.preset == "best");
    CHECK(cfg.excludedFamilies == std::vector<std::string>{"mlp", "knn"});
    CHECK(cfg.excludedColumns == std::vector<std::string>{"id", "ts"});
    CHECK(cfg.quantileLevels == std::vector<double>{0.25, 0.75});
    CHECK(cfg.seed == 42u);
    CHECK(cfg.delimiter == '\t');
    CHECK(cfg.numGpus == -1);

    cfg.set("delimiter", ";");
    CHECK(cfg.delimiter == ';');
}

TEST_CASE("set rejects unknown keys and malformed values", "[config]") {
    AutoConfig cfg;
    CHECK_THROWS_WITH(cfg.set("--bogus", "1"), Contains("Unknown option: --bogus"));
    CHECK_THROWS_AS(cfg.set("kfold", "four"), Strata::ConfigurationException);
    CHECK_THROWS_AS(cfg.set("kfold", "3x"), Strata::ConfigurationException);
    CHECK_THROWS_AS(cfg.set("ensemble_rounds", "0"), Strata::ConfigurationException);
    CHECK_THROWS_AS(cfg.set("num_gpus", "-2"), Strata::ConfigurationException);
    CHECK_THROWS_AS(cfg.set("verbose", "maybe"), Strata::ConfigurationException);
    CHECK_THROWS_AS(cfg.set("seed", "-5"), Strata::ConfigurationException);
    CHECK_THROWS_AS(cfg.set("delimiter", ";;"), Strata::ConfigurationException);
    CHECK_THROWS_AS(cfg.set("grace_seconds", "-1"), Strata::ConfigurationException);
}

TEST_CASE("validate enforces the documented ranges", "[config]") {
    CHECK_NOTHROW(labelled().validate());
    CHECK_THROWS_WITH(AutoConfig{}.validate(), Contains("label column is required"));

    AutoConfig cfg = labelled();
    SECTION("time limit") {
        cfg.timeLimit = 0.0;
        CHECK_THROWS_WITH(cfg.validate(), Contains("time_limit"));
    }
    SECTION("problem type") {
        cfg.problemType = "ranking";
        CHECK_THROWS_WITH(cfg.validate(), Contains("problem_type"));
    }
    SECTION("export format") {
        cfg.exportFormat = "json";
        CHECK_THROWS_WITH(cfg.validate(), Contains("export_format"));
    }
    SECTION("metric") {
        cfg.evalMetric = "f1_macro";
        CHECK_THROWS_WITH(cfg.validate(), Contains("Unknown eval_metric"));
    }
    SECTION("preset") {
        cfg.preset = "turbo";
        CHECK_THROWS_AS(cfg.validate(), Strata::ConfigurationException);
    }
    SECTION("tie break") {
        cfg.ensembleTieBreak = "random";
        CHECK_THROWS_AS(cfg.validate(), Strata::ConfigurationException);
    }
    SECTION("quantile levels only matter for quantile problems") {
        cfg.quantileLevels = {0.5, 1.5};
        CHECK_NOTHROW(cfg.validate());
        cfg.problemType = "quantile";
        CHECK_THROWS_WITH(cfg.validate(), Contains("strictly between 0 and 1"));
        cfg.quantileLevels = {0.2, 0.2};
        CHECK_THROWS_WITH(cfg.validate(), Contains("must not repeat"));
        cfg.quantileLevels.clear();
        CHECK_THROWS_WITH(cfg.validate(), Contains("must not be empty"));
    }
    SECTION("single fold") {
        cfg.kfold = 1;
        CHECK_THROWS_WITH(cfg.validate(), Contains("kfold"));
    }
    SECTION("time limit ratio") {
        cfg.maxTimeLimitRatio = 1.5;
        CHECK_THROWS_WITH(cfg.validate(), Contains("max_time_limit_ratio"));
    }
    SECTION("weight column equals the label") {
        cfg.weightColumn = "target";
        CHECK_THROWS_WITH(cfg.validate(), Contains("weight_column"));
    }
    SECTION("predictions without a test file") {
        cfg.predictionsOut = "pred.csv";
        CHECK_THROWS_WITH(cfg.validate(), Contains("requires --test"));
        cfg.testPath = "test.csv";
        CHECK_NOTHROW(cfg.validate());
    }
}

TEST_CASE("config files accept loose yaml and json", "[config]") {
    TestData::TempDir dir;

    SECTION("yaml with comments") {
        const std::string path = dir.write("strata.yaml",
                                           "# training run\n"
                                           "label: price\n"
                                           "time_limit: 30  # seconds\n"
                                           "preset: high\n"
                                           "excluded_families: knn, mlp\n"
                                           "\n"
                                           "verbose: false\n");
        const AutoConfig cfg = AutoConfig::fromFile(path, AutoConfig{});
        CHECK(cfg.labelColumn == "price");
        CHECK(cfg.timeLimit == Approx(30.0));
        CHECK(cfg.preset == "high");
        CHECK(cfg.excludedFamilies == std::vector<std::string>{"knn", "mlp"});
        CHECK_FALSE(cfg.verbose);
    }
    SECTION("json-ish") {
        const std::string path = dir.write("strata.json",
                                           "{\n"
                                           "  \"label\": \"y\",\n"
                                           "  \"kfold\": 3,\n"
                                           "  \"eval_metric\": \"MAE\"\n"
                                           "}\n");
        AutoConfig base;
        base.seed = 7;
        const AutoConfig cfg = AutoConfig::fromFile(path, base);
        CHECK(cfg.labelColumn == "y");
        CHECK(cfg.kfold == 3);
        CHECK(cfg.evalMetric == "mae");
        CHECK(cfg.seed == 7u);
    }
    SECTION("errors carry the line number") {
        const std::string path = dir.write("bad.yaml", "label: y\nkfold: lots\n");
        CHECK_THROWS_WITH(AutoConfig::fromFile(path, AutoConfig{}), Contains("Config parse error at line 2"));
    }
    SECTION("missing file") {
        CHECK_THROWS_WITH(AutoConfig::fromFile(dir.file("absent.yaml"), AutoConfig{}),
                          Contains("Could not open config file"));
    }
}

TEST_CASE("command line flags override the config file", "[config]") {
    TestData::TempDir dir;
    const std::string configPath = dir.write("run.yaml", "label: price\ntime_limit: 30\npreset: best\n");

    Args args({"strata", "train.csv", "--config", configPath, "--time-limit", "5", "--num-gpus", "0"});
    const AutoConfig cfg = AutoConfig::fromArgs(args.argc(), args.argv());
    CHECK(cfg.datasetPath == "train.csv");
    CHECK(cfg.labelColumn == "price");
    CHECK(cfg.timeLimit == Approx(5.0));
    CHECK(cfg.preset == "best");
    CHECK(cfg.numGpus == 0);
}

TEST_CASE("command line errors", "[config]") {
    Args noDataset({"strata", "--label", "y"});
    CHECK_THROWS_WITH(AutoConfig::fromArgs(noDataset.argc(), noDataset.argv()), Contains("Usage: strata"));

    Args onlyProgram({"strata"});
    CHECK_THROWS_AS(AutoConfig::fromArgs(onlyProgram.argc(), onlyProgram.argv()), Strata::ConfigurationException);

    Args stray({"strata", "train.csv", "--label", "y", "extra"});
    CHECK_THROWS_WITH(AutoConfig::fromArgs(stray.argc(), stray.argv()), Contains("Unexpected argument: extra"));

    Args dangling({"strata", "train.csv", "--label"});
    CHECK_THROWS_WITH(AutoConfig::fromArgs(dangling.argc(), dangling.argv()), Contains("--label expects a value"));

    Args unlabelled({"strata", "train.csv", "--time-limit", "10"});
    CHECK_THROWS_WITH(AutoConfig::fromArgs(unlabelled.argc(), unlabelled.argv()), Contains("label column is required"));
}
