#include "search/breadth_first.hpp"

#include <deque>
#include <set>
#include <utility>

namespace precursor {

std::vector<StatePath> breadthFirstSearch(const StateGraph& graph,
                                          NodeId start,
                                          const GoalTest& goal,
                                          int max_depth,
                                          size_t max_paths) {
    std::vector<StatePath> paths;
    if (!graph.hasNode(start) || max_paths == 0) return paths;

    std::vector<SearchNode> arena;
    arena.push_back({start, SearchNode::kNoParent, 0});

    std::deque<size_t> frontier{0};
    std::set<std::pair<NodeId, int>> expanded;

    while (!frontier.empty() && paths.size() < max_paths) {
        size_t index = frontier.front();
        frontier.pop_front();

        const NodeId current = arena[index].node;
        const int depth = arena[index].depth;

        if (depth >= max_depth) continue;
        if (!expanded.emplace(current, depth).second) continue;

        if (goal(current)) {
            paths.push_back(tracePath(graph, arena, index));
            continue;
        }

        for (NodeId next : graph.getSuccessors(current)) {
            arena.push_back({next, index, depth + 1});
            frontier.push_back(arena.size() - 1);
        }
    }

    return paths;
}

} // namespace precursor
