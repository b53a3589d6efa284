#pragma once

#include "graph/state_graph.hpp"
#include "search/search_state.hpp"

#include <memory>
#include <string>

namespace precursor {

// ─── Heuristic ─────────────────────────────────────────────────
// Estimate of the remaining distance from a node to a failure state.
// Plugged into A*; must return 0 at failure states.

class Heuristic {
public:
    virtual ~Heuristic() = default;

    virtual double estimate(const StateGraph& graph, NodeId node) const = 0;

    /// Configuration name of this heuristic.
    virtual std::string name() const = 0;
};

/// 0 at a failure state, a fixed positive estimate anywhere else.
class ConstantHeuristic : public Heuristic {
public:
    explicit ConstantHeuristic(double estimate = 1.0) : estimate_(estimate) {}

    double estimate(const StateGraph& graph, NodeId node) const override;
    std::string name() const override { return "time_to_failure"; }

private:
    double estimate_;
};

/// Minimum label Hamming distance to any failure state of the same
/// machine, or no_match_cost when the machine has no failure state.
class SensorDistanceHeuristic : public Heuristic {
public:
    explicit SensorDistanceHeuristic(double no_match_cost = 10.0)
        : no_match_cost_(no_match_cost) {}

    double estimate(const StateGraph& graph, NodeId node) const override;
    std::string name() const override { return "sensor_distance"; }

private:
    double no_match_cost_;
};

std::unique_ptr<Heuristic> makeHeuristic(HeuristicKind kind);

} // namespace precursor
