#pragma once

#include "graph/state_graph.hpp"
#include "search/search_state.hpp"

#include <vector>

namespace precursor {

/// Breadth-first enumeration of paths from start to goal nodes.
///
/// A (node, depth) pair is expanded at most once, so a node can still be
/// reached again at a different depth. Goal nodes end their path and are
/// not expanded. Nodes at depth >= max_depth are dropped, so no returned
/// path has more than max_depth states. Stops after max_paths paths.
std::vector<StatePath> breadthFirstSearch(const StateGraph& graph,
                                          NodeId start,
                                          const GoalTest& goal,
                                          int max_depth = 50,
                                          size_t max_paths = 10);

} // namespace precursor
