#include "search/depth_first.hpp"

#include <unordered_set>

namespace precursor {

namespace {

struct Frame {
    NodeId node;
    size_t next_child = 0;
};

StatePath toStatePath(const StateGraph& graph, const std::vector<NodeId>& ids) {
    StatePath path;
    path.reserve(ids.size());
    for (NodeId id : ids) {
        path.push_back(graph.getState(id));
    }
    return path;
}

} // namespace

std::vector<StatePath> depthFirstSearch(const StateGraph& graph,
                                        NodeId start,
                                        const GoalTest& goal,
                                        int max_depth,
                                        size_t max_paths) {
    std::vector<StatePath> paths;
    if (!graph.hasNode(start) || max_depth <= 0 || max_paths == 0) return paths;

    if (goal(start)) {
        paths.push_back({graph.getState(start)});
        return paths;
    }

    std::vector<Frame> stack;
    stack.push_back({start});
    std::vector<NodeId> active_path{start};
    std::unordered_set<NodeId> on_path{start};

    while (!stack.empty() && paths.size() < max_paths) {
        Frame& frame = stack.back();
        const auto& successors = graph.getSuccessors(frame.node);

        if (frame.next_child >= successors.size()) {
            // Backtrack
            on_path.erase(frame.node);
            active_path.pop_back();
            stack.pop_back();
            continue;
        }

        NodeId next = successors[frame.next_child++];
        if (on_path.count(next)) continue;

        // Depth of next equals the number of states already on the path.
        if (static_cast<int>(active_path.size()) >= max_depth) continue;

        if (goal(next)) {
            active_path.push_back(next);
            paths.push_back(toStatePath(graph, active_path));
            active_path.pop_back();
            continue;
        }

        on_path.insert(next);
        active_path.push_back(next);
        stack.push_back({next});
    }

    return paths;
}

} // namespace precursor
