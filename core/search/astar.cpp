#include "search/astar.hpp"

#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace precursor {

namespace {

struct OpenEntry {
    double priority;
    uint64_t sequence;   // insertion counter, breaks priority ties
    size_t index;        // into the search arena
};

struct OpenEntryOrder {
    bool operator()(const OpenEntry& a, const OpenEntry& b) const {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.sequence > b.sequence;
    }
};

} // namespace

std::optional<StatePath> aStarSearch(const StateGraph& graph,
                                     NodeId start,
                                     const GoalTest& goal,
                                     const Heuristic& heuristic,
                                     int max_depth,
                                     double weight) {
    if (!graph.hasNode(start)) return std::nullopt;

    std::vector<SearchNode> arena;
    std::priority_queue<OpenEntry, std::vector<OpenEntry>, OpenEntryOrder> open;
    std::unordered_map<NodeId, double> g_score;
    std::unordered_set<NodeId> closed;
    uint64_t sequence = 0;

    SearchNode root;
    root.node = start;
    root.heuristic_cost = heuristic.estimate(graph, start) * weight;
    arena.push_back(root);
    open.push({root.totalCost(), sequence++, 0});
    g_score[start] = 0.0;

    while (!open.empty()) {
        const size_t index = open.top().index;
        open.pop();

        const NodeId current = arena[index].node;
        if (!closed.insert(current).second) continue;

        if (arena[index].depth >= max_depth) continue;

        if (goal(current)) {
            return tracePath(graph, arena, index);
        }

        const double g = arena[index].cost;
        const int depth = arena[index].depth;
        for (NodeId next : graph.getSuccessors(current)) {
            if (closed.count(next)) continue;

            const double tentative = g + 1.0;
            auto it = g_score.find(next);
            if (it != g_score.end() && tentative >= it->second) continue;
            g_score[next] = tentative;

            SearchNode child;
            child.node = next;
            child.parent = index;
            child.depth = depth + 1;
            child.cost = tentative;
            child.heuristic_cost = heuristic.estimate(graph, next) * weight;
            arena.push_back(child);
            open.push({child.totalCost(), sequence++, arena.size() - 1});
        }
    }

    return std::nullopt;
}

} // namespace precursor
