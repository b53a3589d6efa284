#pragma once

#include "graph/state_graph.hpp"
#include "search/search_state.hpp"

#include <limits>
#include <vector>

namespace precursor {

/// Depth-first enumeration of simple paths from start to goal nodes.
/// Successors are explored in adjacency order. A node already on the
/// active path is never revisited, goal nodes end their path, and the
/// depth rule matches breadthFirstSearch.
std::vector<StatePath> depthFirstSearch(const StateGraph& graph,
                                        NodeId start,
                                        const GoalTest& goal,
                                        int max_depth = 50,
                                        size_t max_paths = std::numeric_limits<size_t>::max());

} // namespace precursor
