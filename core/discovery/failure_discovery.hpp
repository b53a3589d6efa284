#pragma once

#include "discovery/random_source.hpp"
#include "graph/state_graph.hpp"
#include "search/search_state.hpp"

#include <vector>

namespace precursor {

/// Bounds applied by discoverFailurePaths.
struct DiscoveryOptions {
    int depth_cap = 10;                  // BFS depth is min(max_depth, depth_cap)
    size_t max_paths_per_start = 5;
    size_t max_total_paths = 100;        // No new start state once reached
    size_t fallback_sample_size = 100;   // Start states drawn when none precede a failure
    unsigned threads = 1;                // >1 fans start states out to workers
};

/// Non-failure states with a direct edge into a failure state, in node
/// registration order.
std::vector<NodeId> failurePrecursors(const StateGraph& graph);

/// Start states for discovery: failurePrecursors, or a random sample of
/// non-failure states when the graph has none.
std::vector<NodeId> selectStartStates(const StateGraph& graph,
                                      RandomSource& random,
                                      size_t fallback_sample_size = 100);

/// Run bounded BFS toward failure states from every start state and
/// collect the accepted paths. The sequential run is deterministic for a
/// given graph and random source. With threads > 1 the searched start
/// states may differ near the global cap, but results are still merged
/// in start-state order.
std::vector<StatePath> discoverFailurePaths(const StateGraph& graph,
                                            const SearchParams& params,
                                            RandomSource& random,
                                            const DiscoveryOptions& options = {});

} // namespace precursor
