#pragma once

#include "graph/state_graph.hpp"
#include "search/astar.hpp"
#include "search/breadth_first.hpp"
#include "search/depth_first.hpp"
#include "search/heuristics.hpp"
#include "search/search_state.hpp"

#include <memory>
#include <vector>

namespace precursor {

/// Search Controller: runs one of the path-finding strategies toward
/// failure states with the configured depth, heuristic and weight.
class SearchController {
public:
    enum class Algorithm {
        BREADTH_FIRST,
        DEPTH_FIRST,
        A_STAR
    };

    explicit SearchController(Algorithm algo = Algorithm::BREADTH_FIRST)
        : algorithm_(algo) {}

    void setAlgorithm(Algorithm algo) { algorithm_ = algo; }
    Algorithm algorithm() const { return algorithm_; }

    /// Paths from start to failure states. A* yields at most one path.
    std::vector<StatePath> run(const StateGraph& graph,
                               NodeId start,
                               const SearchParams& params,
                               size_t max_paths = 10) const {
        const GoalTest goal = failureGoal(graph);
        switch (algorithm_) {
            case Algorithm::BREADTH_FIRST:
                return breadthFirstSearch(graph, start, goal, params.max_depth, max_paths);
            case Algorithm::DEPTH_FIRST:
                return depthFirstSearch(graph, start, goal, params.max_depth, max_paths);
            case Algorithm::A_STAR: {
                auto heuristic = makeHeuristic(params.heuristic);
                auto path = aStarSearch(graph, start, goal, *heuristic,
                                        params.max_depth, params.a_star_weight);
                if (!path) return {};
                return {std::move(*path)};
            }
        }
        return {};
    }

private:
    Algorithm algorithm_;
};

} // namespace precursor
