#include "graph/state_graph.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace precursor {

// ─── Node operations ───────────────────────────────────────────

NodeId StateGraph::addNode(const State& state) {
    auto it = index_.find(state);
    if (it != index_.end()) return it->second;

    NodeId id = nodes_.size();
    nodes_.push_back(state);
    index_.emplace(state, id);
    outgoing_.emplace_back();
    incoming_.emplace_back();
    failure_flags_.push_back(false);
    records_.emplace_back();
    return id;
}

std::optional<NodeId> StateGraph::findNode(const State& state) const {
    auto it = index_.find(state);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

const State& StateGraph::getState(NodeId id) const {
    checkNode(id);
    return nodes_[id];
}

void StateGraph::checkNode(NodeId id) const {
    if (!hasNode(id)) {
        throw std::runtime_error("Node not found: " + std::to_string(id));
    }
}

// ─── Edge operations ───────────────────────────────────────────

bool StateGraph::addEdge(NodeId source, NodeId target) {
    checkNode(source);
    checkNode(target);

    auto& out = outgoing_[source];
    if (std::find(out.begin(), out.end(), target) != out.end()) return false;

    out.push_back(target);
    incoming_[target].push_back(source);
    edge_count_++;
    return true;
}

bool StateGraph::addEdge(const State& source, const State& target) {
    NodeId s = addNode(source);
    NodeId t = addNode(target);
    return addEdge(s, t);
}

// ─── Failure marking ───────────────────────────────────────────

NodeId StateGraph::markFailureState(const State& state) {
    NodeId id = addNode(state);
    markFailure(id);
    return id;
}

void StateGraph::markFailure(NodeId id) {
    checkNode(id);
    if (failure_flags_[id]) return;
    failure_flags_[id] = true;
    failure_nodes_.push_back(id);
}

bool StateGraph::isFailure(NodeId id) const {
    return hasNode(id) && failure_flags_[id];
}

bool StateGraph::isFailureState(const State& state) const {
    auto id = findNode(state);
    return id && failure_flags_[*id];
}

// ─── Adjacency queries ────────────────────────────────────────

const std::vector<NodeId>& StateGraph::getSuccessors(NodeId id) const {
    checkNode(id);
    return outgoing_[id];
}

const std::vector<NodeId>& StateGraph::getPredecessors(NodeId id) const {
    checkNode(id);
    return incoming_[id];
}

std::vector<State> StateGraph::getNeighbors(const State& state) const {
    auto id = findNode(state);
    if (!id) return {};
    std::vector<State> result;
    result.reserve(outgoing_[*id].size());
    for (NodeId next : outgoing_[*id]) {
        result.push_back(nodes_[next]);
    }
    return result;
}

// ─── Traceability ─────────────────────────────────────────────

void StateGraph::attachRecord(NodeId id, const CanonicalRecord& record) {
    checkNode(id);
    records_[id].push_back(record);
}

const std::vector<CanonicalRecord>& StateGraph::getRecords(NodeId id) const {
    checkNode(id);
    return records_[id];
}

// ─── Iteration ────────────────────────────────────────────────

void StateGraph::forEachNode(const std::function<void(NodeId, const State&)>& fn) const {
    for (NodeId id = 0; id < nodes_.size(); id++) {
        fn(id, nodes_[id]);
    }
}

} // namespace precursor
