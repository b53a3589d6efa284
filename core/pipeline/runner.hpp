#pragma once

#include "discovery/failure_discovery.hpp"
#include "discovery/random_source.hpp"
#include "graph/graph_builder.hpp"
#include "graph/record.hpp"
#include "graph/state_graph.hpp"
#include "patterns/sequence_extractor.hpp"
#include "patterns/warning_ranker.hpp"
#include "search/search_state.hpp"

#include <optional>
#include <string>
#include <vector>

namespace precursor {

struct PipelineOptions {
    size_t max_records = 1000;       // Larger batches are sampled down
    GraphBuildOptions build;
    DiscoveryOptions discovery;
};

struct PipelineResult {
    size_t record_count = 0;         // after sampling
    BuildMode mode = BuildMode::TEMPORAL;
    StateGraph graph;
    std::vector<StatePath> paths;
    std::vector<FailureSequence> sequences;
    std::vector<WarningSign> warnings;
};

/// Reduce a batch to max_records. Failure records fill up to half the
/// budget, normal records the rest; the sample is then shuffled.
/// Batches within budget are returned unchanged.
std::vector<CanonicalRecord> sampleRecords(const std::vector<CanonicalRecord>& records,
                                           size_t max_records,
                                           RandomSource& random);

/// Records → graph → paths → sequences → warnings.
/// Configuration is validated before the graph is built.
PipelineResult runPipeline(const std::vector<CanonicalRecord>& records,
                           const GraphConfig& graph_config,
                           const SearchParams& params,
                           RandomSource& random,
                           const PipelineOptions& options = {});

/// Load the CSV and both configuration files, run the pipeline and
/// write sequences.json and warning_signs.json into output_dir.
PipelineResult runPipelineFromFiles(const std::string& data_path,
                                    const std::string& graph_config_path,
                                    const std::string& search_params_path,
                                    const std::string& output_dir,
                                    RandomSource& random,
                                    const PipelineOptions& options = {});

/// Best-first path from start to the nearest failure state using the
/// configured heuristic, weight and depth.
std::optional<StatePath> shortestFailurePath(const StateGraph& graph,
                                             NodeId start,
                                             const SearchParams& params);

} // namespace precursor
