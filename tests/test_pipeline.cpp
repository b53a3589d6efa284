#include <gtest/gtest.h>
#include "config/config_loader.hpp"
#include "pipeline/runner.hpp"
#include "search/astar.hpp"
#include "search/breadth_first.hpp"
#include "search/heuristics.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

using namespace precursor;

namespace {

GraphConfig temperatureConfig() {
    GraphConfig config;
    config.discretization["Temperature"] =
        BinningScheme({0, 25, 50, 100}, {"low", "medium", "high"});
    config.state_components = {"Temperature"};
    return config;
}

std::vector<CanonicalRecord> rampToFailure() {
    return {
        CanonicalRecord("M1", 0, {{"Temperature", 10}}, false),
        CanonicalRecord("M1", 1, {{"Temperature", 30}}, false),
        CanonicalRecord("M1", 2, {{"Temperature", 60}}, true),
    };
}

State temp(const std::string& label) {
    return State("M1", {label});
}

} // namespace

// ─── End to end ────────────────────────────────────────────────

TEST(PipelineTest, RampToFailureThroughEveryStage) {
    StateGraph graph = buildGraph(rampToFailure(), temperatureConfig());
    EXPECT_EQ(graph.nodeCount(), 3u);
    EXPECT_EQ(graph.edgeCount(), 2u);
    EXPECT_EQ(graph.failureCount(), 1u);

    const NodeId s1 = *graph.findNode(temp("low"));
    const StatePath expected{temp("low"), temp("medium"), temp("high")};

    auto bfs = breadthFirstSearch(graph, s1, failureGoal(graph), 10);
    ASSERT_EQ(bfs.size(), 1u);
    EXPECT_EQ(bfs[0], expected);

    ConstantHeuristic heuristic;
    auto best = aStarSearch(graph, s1, failureGoal(graph), heuristic);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, expected);

    auto sequences = extractSequences(bfs, 2);
    ASSERT_EQ(sequences.size(), 1u);
    EXPECT_EQ(sequences[0].states, (std::vector<State>{temp("low"), temp("medium")}));
    EXPECT_EQ(sequences[0].frequency, 1);

    auto warnings = rankWarningSigns(sequences);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_DOUBLE_EQ(warnings[0].predictive_score, 0.1);
    EXPECT_EQ(warnings[0].pattern, "State transition: (low) -> (medium) (2 steps)");
}

TEST(PipelineTest, RunPipelineStartsFromFailurePrecursors) {
    SearchParams params;
    params.min_pattern_length = 2;
    SeededRandomSource random;

    PipelineResult result = runPipeline(rampToFailure(), temperatureConfig(), params, random);
    EXPECT_EQ(result.record_count, 3u);
    EXPECT_EQ(result.mode, BuildMode::TEMPORAL);
    EXPECT_EQ(result.graph.nodeCount(), 3u);

    ASSERT_EQ(result.paths.size(), 1u);
    EXPECT_EQ(result.paths[0], (StatePath{temp("medium"), temp("high")}));
    ASSERT_EQ(result.sequences.size(), 1u);
    EXPECT_EQ(result.sequences[0].states, std::vector<State>{temp("medium")});
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_DOUBLE_EQ(result.warnings[0].predictive_score, 0.1);
}

TEST(PipelineTest, InvalidConfigurationFailsBeforeBuilding) {
    GraphConfig bad = temperatureConfig();
    bad.state_components.push_back("Pressure");
    SeededRandomSource random;
    EXPECT_THROW(runPipeline(rampToFailure(), bad, SearchParams{}, random), ConfigError);

    SearchParams params;
    params.max_depth = 0;
    EXPECT_THROW(runPipeline(rampToFailure(), temperatureConfig(), params, random), ConfigError);
}

TEST(PipelineTest, ShortestFailurePathUsesConfiguredHeuristic) {
    StateGraph graph = buildGraph(rampToFailure(), temperatureConfig());
    SearchParams params;
    params.heuristic = HeuristicKind::SENSOR_DISTANCE;

    auto path = shortestFailurePath(graph, *graph.findNode(temp("low")), params);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 3u);

    params.max_depth = 2;
    EXPECT_FALSE(shortestFailurePath(graph, *graph.findNode(temp("low")), params).has_value());
}

// ─── Record sampling ───────────────────────────────────────────

TEST(PipelineTest, SmallBatchIsNotSampled) {
    SeededRandomSource random;
    auto records = rampToFailure();
    auto sampled = sampleRecords(records, 1000, random);
    ASSERT_EQ(sampled.size(), records.size());
    for (size_t i = 0; i < records.size(); i++) {
        EXPECT_EQ(sampled[i].machine_id, records[i].machine_id);
        EXPECT_DOUBLE_EQ(sampled[i].time_key, records[i].time_key);
    }
}

TEST(PipelineTest, FailuresFillAtMostHalfTheSample) {
    std::vector<CanonicalRecord> records;
    for (int i = 0; i < 10; i++) {
        records.emplace_back("M1", i, std::unordered_map<std::string, double>{}, i < 8);
    }
    SeededRandomSource random;
    auto sampled = sampleRecords(records, 4, random);
    ASSERT_EQ(sampled.size(), 4u);
    size_t failures = 0;
    for (const auto& record : sampled) {
        if (record.failure) failures++;
    }
    EXPECT_EQ(failures, 2u);
}

TEST(PipelineTest, ScarceFailuresAreAllKept) {
    std::vector<CanonicalRecord> records;
    for (int i = 0; i < 10; i++) {
        records.emplace_back("M1", i, std::unordered_map<std::string, double>{}, i == 3);
    }
    SeededRandomSource random;
    auto sampled = sampleRecords(records, 4, random);
    ASSERT_EQ(sampled.size(), 4u);
    size_t failures = 0;
    for (const auto& record : sampled) {
        if (record.failure) failures++;
    }
    EXPECT_EQ(failures, 1u);
}

// ─── File driven run ───────────────────────────────────────────

TEST(PipelineTest, RunsFromFilesAndWritesOutputs) {
    const auto dir = std::filesystem::temp_directory_path() / "precursor_pipeline_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    const auto data = dir / "data.csv";
    std::ofstream(data) << "Timestamp,Machine_ID,Temperature,Failure_Status\n"
                           "2024-01-01 00:00:00,007,10,0\n"
                           "2024-01-01 00:01:00,007,30,0\n"
                           "2024-01-01 00:02:00,007,60,1\n";
    const auto graph_config = dir / "graph_config.json";
    std::ofstream(graph_config) << R"({"discretization": {"Temperature": )"
                                   R"({"bins": [0, 25, 50, 100], "labels": ["low", "medium", "high"]}},)"
                                   R"( "state_components": ["Temperature"]})";
    const auto search_params = dir / "search_params.yaml";
    std::ofstream(search_params) << "max_depth: 10\nmin_pattern_length: 2\n";

    const auto output = dir / "out";
    SeededRandomSource random;
    PipelineResult result = runPipelineFromFiles(data.string(), graph_config.string(),
                                                 search_params.string(), output.string(),
                                                 random);
    EXPECT_EQ(result.record_count, 3u);
    ASSERT_EQ(result.warnings.size(), 1u);

    YAML::Node sequences = YAML::LoadFile((output / "sequences.json").string());
    ASSERT_EQ(sequences["sequences"].size(), 1u);
    EXPECT_EQ(sequences["sequences"][0]["frequency"].as<int>(), 1);
    EXPECT_EQ(sequences["sequences"][0]["machines"][0].as<std::string>(), "007");

    std::ifstream raw((output / "sequences.json").string());
    std::stringstream buffer;
    buffer << raw.rdbuf();
    EXPECT_EQ(buffer.str().front(), '{');
    EXPECT_NE(buffer.str().find("\"007\""), std::string::npos);

    YAML::Node warnings = YAML::LoadFile((output / "warning_signs.json").string());
    ASSERT_EQ(warnings["warning_signs"].size(), 1u);
    EXPECT_DOUBLE_EQ(warnings["warning_signs"][0]["predictive_score"].as<double>(), 0.1);

    std::filesystem::remove_all(dir);
}
