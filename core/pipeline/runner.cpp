#include "pipeline/runner.hpp"

#include "config/config_loader.hpp"
#include "io/csv_loader.hpp"
#include "io/result_writer.hpp"
#include "search/astar.hpp"
#include "search/heuristics.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace precursor {

std::vector<CanonicalRecord> sampleRecords(const std::vector<CanonicalRecord>& records,
                                           size_t max_records,
                                           RandomSource& random) {
    if (records.size() <= max_records) return records;

    std::vector<size_t> failures;
    std::vector<size_t> normal;
    for (size_t i = 0; i < records.size(); i++) {
        (records[i].failure ? failures : normal).push_back(i);
    }

    const size_t failure_budget = std::min(failures.size(), max_records / 2);
    const size_t normal_budget = max_records - failure_budget;

    std::vector<size_t> chosen;
    chosen.reserve(max_records);
    for (size_t i : random.sampleIndices(failures.size(), failure_budget)) {
        chosen.push_back(failures[i]);
    }
    const size_t failure_count = chosen.size();
    for (size_t i : random.sampleIndices(normal.size(), normal_budget)) {
        chosen.push_back(normal[i]);
    }
    random.shuffle(chosen);

    std::vector<CanonicalRecord> sampled;
    sampled.reserve(chosen.size());
    for (size_t i : chosen) {
        sampled.push_back(records[i]);
    }

    spdlog::info("Sampled {} records ({} failures, {} normal) from {} total",
                 sampled.size(), failure_count, sampled.size() - failure_count,
                 records.size());
    return sampled;
}

PipelineResult runPipeline(const std::vector<CanonicalRecord>& records,
                           const GraphConfig& graph_config,
                           const SearchParams& params,
                           RandomSource& random,
                           const PipelineOptions& options) {
    validateGraphConfig(graph_config);
    validateSearchParams(params);

    PipelineResult result;
    const auto batch = sampleRecords(records, options.max_records, random);
    result.record_count = batch.size();
    result.mode = selectBuildMode(batch);
    result.graph = buildGraph(batch, graph_config, options.build);

    result.paths = discoverFailurePaths(result.graph, params, random, options.discovery);
    result.sequences = extractSequences(result.paths, params.min_pattern_length);
    result.warnings = rankWarningSigns(result.sequences);

    spdlog::info("Found {} failure sequences, ranked {} warning signs",
                 result.sequences.size(), result.warnings.size());
    return result;
}

PipelineResult runPipelineFromFiles(const std::string& data_path,
                                    const std::string& graph_config_path,
                                    const std::string& search_params_path,
                                    const std::string& output_dir,
                                    RandomSource& random,
                                    const PipelineOptions& options) {
    const GraphConfig graph_config = loadGraphConfig(graph_config_path);
    const SearchParams params = loadSearchParams(search_params_path);
    const auto records = loadTimestampedCsv(data_path);
    spdlog::info("Loaded {} records from {}", records.size(), data_path);

    PipelineResult result = runPipeline(records, graph_config, params, random, options);

    std::filesystem::create_directories(output_dir);
    const auto dir = std::filesystem::path(output_dir);
    writeSequences((dir / "sequences.json").string(), result.sequences);
    writeWarningSigns((dir / "warning_signs.json").string(), result.warnings);
    spdlog::info("Outputs written to {}", output_dir);
    return result;
}

std::optional<StatePath> shortestFailurePath(const StateGraph& graph,
                                             NodeId start,
                                             const SearchParams& params) {
    auto heuristic = makeHeuristic(params.heuristic);
    return aStarSearch(graph, start, failureGoal(graph), *heuristic,
                       params.max_depth, params.a_star_weight);
}

} // namespace precursor
