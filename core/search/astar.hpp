#pragma once

#include "graph/state_graph.hpp"
#include "search/heuristics.hpp"
#include "search/search_state.hpp"

#include <optional>

namespace precursor {

/// Best-first search ordered by g + h * weight with unit edge cost.
///
/// A node is closed the first time it is popped; later pops of the same
/// node are skipped. Entries with equal priority pop in insertion order.
/// Returns the first path that reaches a goal, or std::nullopt when the
/// frontier empties or every remaining candidate is at the depth bound.
std::optional<StatePath> aStarSearch(const StateGraph& graph,
                                     NodeId start,
                                     const GoalTest& goal,
                                     const Heuristic& heuristic,
                                     int max_depth = 50,
                                     double weight = 1.0);

} // namespace precursor
