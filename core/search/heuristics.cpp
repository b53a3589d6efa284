#include "search/heuristics.hpp"

#include <algorithm>
#include <limits>

namespace precursor {

double ConstantHeuristic::estimate(const StateGraph& graph, NodeId node) const {
    return graph.isFailure(node) ? 0.0 : estimate_;
}

double SensorDistanceHeuristic::estimate(const StateGraph& graph, NodeId node) const {
    if (graph.isFailure(node)) return 0.0;

    const State& current = graph.getState(node);
    size_t best = std::numeric_limits<size_t>::max();
    for (NodeId failure : graph.failureNodes()) {
        const State& target = graph.getState(failure);
        if (target.machine_id != current.machine_id) continue;
        best = std::min(best, hammingDistance(current, target));
    }

    if (best == std::numeric_limits<size_t>::max()) return no_match_cost_;
    return static_cast<double>(best);
}

std::unique_ptr<Heuristic> makeHeuristic(HeuristicKind kind) {
    switch (kind) {
        case HeuristicKind::TIME_TO_FAILURE:
            return std::make_unique<ConstantHeuristic>();
        case HeuristicKind::SENSOR_DISTANCE:
            return std::make_unique<SensorDistanceHeuristic>();
    }
    return std::make_unique<ConstantHeuristic>();
}

} // namespace precursor
