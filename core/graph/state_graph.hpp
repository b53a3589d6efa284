#pragma once

#include "graph/record.hpp"
#include "graph/state.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace precursor {

using NodeId = uint64_t;

// ─── StateGraph ────────────────────────────────────────────────
// Directed transition graph over discretized states.
// Node ids are dense and follow registration order, which makes every
// enumeration over the graph deterministic. States are deduplicated
// through a hash index keyed by (machine_id, labels).

class StateGraph {
public:
    StateGraph() = default;

    // ── Node operations ──
    /// Register a state, or return the id of the equal state already present.
    NodeId addNode(const State& state);
    std::optional<NodeId> findNode(const State& state) const;
    bool hasNode(NodeId id) const { return id < nodes_.size(); }
    const State& getState(NodeId id) const;
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──
    /// Add a directed edge; missing endpoints are registered and
    /// duplicate edges are ignored. Returns false for a duplicate.
    bool addEdge(NodeId source, NodeId target);
    bool addEdge(const State& source, const State& target);
    size_t edgeCount() const { return edge_count_; }

    // ── Failure marking ──
    NodeId markFailureState(const State& state);
    void markFailure(NodeId id);
    bool isFailure(NodeId id) const;
    bool isFailureState(const State& state) const;
    /// Failure nodes in the order they were first marked.
    const std::vector<NodeId>& failureNodes() const { return failure_nodes_; }
    size_t failureCount() const { return failure_nodes_.size(); }

    // ── Adjacency queries ──
    const std::vector<NodeId>& getSuccessors(NodeId id) const;
    const std::vector<NodeId>& getPredecessors(NodeId id) const;
    std::vector<State> getNeighbors(const State& state) const;

    // ── Traceability ──
    void attachRecord(NodeId id, const CanonicalRecord& record);
    const std::vector<CanonicalRecord>& getRecords(NodeId id) const;

    // ── Iteration ──
    void forEachNode(const std::function<void(NodeId, const State&)>& fn) const;

private:
    void checkNode(NodeId id) const;

    std::vector<State> nodes_;
    std::unordered_map<State, NodeId, StateHash> index_;

    // Adjacency lists in insertion order: node_id → node_ids
    std::vector<std::vector<NodeId>> outgoing_;
    std::vector<std::vector<NodeId>> incoming_;

    std::vector<bool> failure_flags_;
    std::vector<NodeId> failure_nodes_;
    std::vector<std::vector<CanonicalRecord>> records_;
    size_t edge_count_ = 0;
};

} // namespace precursor
