#pragma once

#include "discretize/binning.hpp"
#include "graph/record.hpp"
#include "graph/state.hpp"
#include "graph/state_graph.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace precursor {

// ─── Graph Configuration ───────────────────────────────────────
// Per-sensor binning plus the ordered list of sensors that make up a
// state tuple. With state_components = {"Temperature", "Vibration"}
// a state reads like ("medium", "high").

struct GraphConfig {
    std::unordered_map<std::string, BinningScheme> discretization;
    std::vector<std::string> state_components;
};

enum class BuildMode {
    TEMPORAL,    // consecutive readings of a machine are linked
    SIMILARITY   // single reading per machine; link states one label apart
};

const char* buildModeName(BuildMode mode);

struct GraphBuildOptions {
    size_t max_similarity_neighbors = 20;
};

/// Temporal mode as soon as one machine contributes more than one
/// record, similarity mode otherwise. Decided once for the whole batch.
BuildMode selectBuildMode(const std::vector<CanonicalRecord>& records);

/// Discretize one record into its state. Components without an
/// in-range reading get the "unknown" label.
State discretizeRecord(const CanonicalRecord& record, const GraphConfig& config);

/// Build the transition graph for a batch of records.
/// Records are grouped per machine (first-seen order) and sorted by
/// time_key within each group before any node is registered.
///
/// Similarity mode stops scanning a source once it has accepted
/// max_similarity_neighbors edges, so the accepted neighbors depend on
/// node registration order. The same record order gives the same graph.
StateGraph buildGraph(const std::vector<CanonicalRecord>& records,
                      const GraphConfig& config,
                      const GraphBuildOptions& options = {});

} // namespace precursor
