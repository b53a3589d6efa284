#pragma once

#include "graph/state.hpp"
#include "graph/state_graph.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

namespace precursor {

/// An ordered walk through the graph; the last state is the goal.
using StatePath = std::vector<State>;

/// Caller-supplied goal predicate over graph nodes.
using GoalTest = std::function<bool(NodeId)>;

/// Goal predicate "is a failure state" bound to a graph.
inline GoalTest failureGoal(const StateGraph& graph) {
    return [&graph](NodeId id) { return graph.isFailure(id); };
}

enum class HeuristicKind {
    TIME_TO_FAILURE,   // constant estimate
    SENSOR_DISTANCE    // Hamming distance to same-machine failure states
};

/// Search configuration parameters.
struct SearchParams {
    int max_depth = 50;              // Maximum search depth
    int lookback_window = 50;        // Reserved; not enforced by any search
    int min_pattern_length = 3;      // Shorter paths are not patterns
    HeuristicKind heuristic = HeuristicKind::TIME_TO_FAILURE;
    double a_star_weight = 1.0;      // >1 biases A* toward greedy search
};

/// A node in a search tree. Trees are stored as flat arenas and the
/// path is recovered by following parent indices back to the root.
struct SearchNode {
    NodeId node = 0;
    size_t parent = kNoParent;
    int depth = 0;
    double cost = 0.0;               // g: path length so far
    double heuristic_cost = 0.0;     // h * weight

    static constexpr size_t kNoParent = std::numeric_limits<size_t>::max();

    double totalCost() const { return cost + heuristic_cost; }
};

/// Rebuild the state sequence ending at arena[index].
inline StatePath tracePath(const StateGraph& graph,
                           const std::vector<SearchNode>& arena, size_t index) {
    std::vector<NodeId> ids;
    for (size_t i = index; i != SearchNode::kNoParent; i = arena[i].parent) {
        ids.push_back(arena[i].node);
    }
    StatePath path;
    path.reserve(ids.size());
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        path.push_back(graph.getState(*it));
    }
    return path;
}

} // namespace precursor
