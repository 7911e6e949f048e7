#include <catch2/catch.hpp>

#include "Portfolio.h"
#include "StrataExceptions.h"

#include <algorithm>

namespace {
PortfolioQuery query(const std::string& preset, size_t rows = 500) {
    PortfolioQuery q;
    q.problemType = ProblemType::REGRESSION;
    q.rows = rows;
    q.features = 3;
    q.preset = preset;
    return q;
}

ResourceSnapshot machine(int gpus) {
    ResourceSnapshot s;
    s.cpus = 4;
    s.gpus = gpus;
    return s;
}

std::vector<std::string> names(const PortfolioResult& r) {
    std::vector<std::string> out;
    for (const auto& c : r.candidates) out.push_back(c.name);
    return out;
}

bool contains(const std::vector<std::string>& values, const std::string& needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

bool anyNoteStartsWith(const PortfolioResult& r, const std::string& prefix) {
    for (const auto& n : r.notes) {
        if (n.rfind(prefix, 0) == 0) return true;
    }
    return false;
}
} // namespace

TEST_CASE("preset names and aliases resolve", "[portfolio]") {
    CHECK(parsePreset("medium").name == "medium_quality");
    CHECK(parsePreset("BEST").name == "best_quality");
    CHECK(parsePreset("").name == "medium_quality");
    CHECK(parsePreset("extreme_quality").includeExtreme);
    CHECK(parsePreset("high").maxLayers == 2);
    CHECK(parsePreset("medium").rank < parsePreset("extreme").rank);
    CHECK_THROWS_AS(parsePreset("turbo"), Strata::ConfigurationException);
}

TEST_CASE("medium quality draws the four highest-priority entries", "[portfolio]") {
    const PortfolioResult r = Portfolio::build(query("medium"), machine(0), FamilyRegistry::builtin());
    CHECK(names(r) == std::vector<std::string>{"NeuralNet", "DecisionTree", "LinearModel", "KNeighborsDist"});
    for (size_t i = 0; i < r.candidates.size(); ++i) {
        CHECK(r.candidates[i].priority == i);
        CHECK(r.candidates[i].estimate.fitSeconds > 0.0);
    }
    CHECK(r.notes.empty());
}

TEST_CASE("GPU-only candidates are excluded with a single note when no GPU exists", "[portfolio]") {
    const PortfolioResult noGpu = Portfolio::build(query("best"), machine(0), FamilyRegistry::builtin());
    CHECK_FALSE(contains(names(noGpu), "NeuralNetGPU"));
    CHECK(noGpu.candidates.size() == Portfolio::defaultEntries().size() - 5);
    const auto gpuNotes = std::count_if(noGpu.notes.begin(), noGpu.notes.end(), [](const std::string& n) {
        return n.find("No GPU detected") != std::string::npos;
    });
    CHECK(gpuNotes == 1);
    CHECK(contains(noGpu.notes, "No GPU detected; excluded GPU-only candidate(s): NeuralNetGPU"));

    const PortfolioResult withGpu = Portfolio::build(query("best"), machine(1), FamilyRegistry::builtin());
    REQUIRE(contains(names(withGpu), "NeuralNetGPU"));
    const auto it = std::find_if(withGpu.candidates.begin(), withGpu.candidates.end(),
                                 [](const CandidateConfig& c) { return c.name == "NeuralNetGPU"; });
    CHECK(it->requiresGpu);
    CHECK(withGpu.notes.empty());
}

TEST_CASE("extreme quality adds the foundation-model entries on small data", "[portfolio]") {
    const PortfolioResult r = Portfolio::build(query("extreme"), machine(0), FamilyRegistry::builtin());
    CHECK_FALSE(r.extremeGated);
    const auto all = names(r);
    REQUIRE(contains(all, "InContext"));
    CHECK(contains(all, "DecisionTreeXL"));

    const auto it = std::find_if(r.candidates.begin(), r.candidates.end(),
                                 [](const CandidateConfig& c) { return c.name == "InContext"; });
    CHECK(it->requiresExternalWeights);
    CHECK(it->weightsId == "strata-incontext-v1");
    CHECK(it->gpuShareable);
}

TEST_CASE("extreme quality is gated on large data", "[portfolio]") {
    PortfolioQuery q = query("extreme", 40000);
    const PortfolioResult r = Portfolio::build(q, machine(0), FamilyRegistry::builtin());
    CHECK(r.extremeGated);
    CHECK(r.preset.name == "extreme_quality");
    CHECK_FALSE(contains(names(r), "InContext"));
    CHECK_FALSE(contains(names(r), "DecisionTreeXL"));
    CHECK(anyNoteStartsWith(r, "extreme_quality disabled"));
    CHECK(contains(names(r), "Baseline"));
}

TEST_CASE("excluded families are skipped with a note", "[portfolio]") {
    PortfolioQuery q = query("best");
    q.excludedFamilies = {"mlp"};
    const PortfolioResult r = Portfolio::build(q, machine(0), FamilyRegistry::builtin());
    for (const auto& c : r.candidates) CHECK(c.family != "mlp");
    CHECK(contains(r.notes, "NeuralNet skipped: family 'mlp' excluded"));
    CHECK(contains(r.notes, "NeuralNetGPU skipped: family 'mlp' excluded"));
    CHECK_FALSE(anyNoteStartsWith(r, "No GPU detected"));
}

TEST_CASE("row limits drop entries outside their range", "[portfolio]") {
    const PortfolioResult r = Portfolio::build(query("medium", 200000), machine(0), FamilyRegistry::builtin());
    CHECK(names(r) == std::vector<std::string>{"NeuralNet", "DecisionTree", "LinearModel"});
    CHECK(anyNoteStartsWith(r, "KNeighborsDist skipped"));
}

TEST_CASE("entries of unregistered families stay in the list without an estimate", "[portfolio]") {
    Portfolio::Entry mystery;
    mystery.name = "Mystery";
    mystery.family = "mystery";
    Portfolio::Entry baseline;
    baseline.name = "Baseline";
    baseline.family = "constant";

    const PortfolioResult r = Portfolio::build(query("medium"), machine(0), FamilyRegistry::builtin(), {mystery, baseline});
    REQUIRE(r.candidates.size() == 2);
    CHECK(r.candidates[0].name == "Mystery");
    CHECK(r.candidates[0].estimate.fitSeconds == 0.0);
    CHECK(r.candidates[1].estimate.fitSeconds > 0.0);
}

TEST_CASE("unknown presets are rejected by build", "[portfolio]") {
    CHECK_THROWS_AS(Portfolio::build(query("fastest"), machine(0), FamilyRegistry::builtin()),
                    Strata::ConfigurationException);
}
