#include "graph/graph_builder.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace precursor {

namespace {

struct MachineGroup {
    std::string machine_id;
    std::vector<const CanonicalRecord*> records;
};

std::vector<MachineGroup> groupByMachine(const std::vector<CanonicalRecord>& records) {
    std::vector<MachineGroup> groups;
    std::unordered_map<std::string, size_t> group_index;

    for (const auto& record : records) {
        auto it = group_index.find(record.machine_id);
        if (it == group_index.end()) {
            it = group_index.emplace(record.machine_id, groups.size()).first;
            groups.push_back({record.machine_id, {}});
        }
        groups[it->second].records.push_back(&record);
    }

    for (auto& group : groups) {
        std::stable_sort(group.records.begin(), group.records.end(),
                         [](const CanonicalRecord* a, const CanonicalRecord* b) {
                             return a->time_key < b->time_key;
                         });
    }
    return groups;
}

void addTemporalEdges(StateGraph& graph,
                      const std::vector<std::vector<NodeId>>& machine_sequences) {
    for (const auto& sequence : machine_sequences) {
        for (size_t i = 0; i + 1 < sequence.size(); i++) {
            graph.addEdge(sequence[i], sequence[i + 1]);
        }
    }
}

void addSimilarityEdges(StateGraph& graph, size_t max_neighbors) {
    const size_t n = graph.nodeCount();
    size_t capped_sources = 0;

    for (NodeId source = 0; source < n; source++) {
        const State& from = graph.getState(source);
        size_t neighbors_found = 0;
        for (NodeId target = 0; target < n; target++) {
            if (target == source) continue;
            if (neighbors_found >= max_neighbors) {
                capped_sources++;
                break;
            }
            if (differsByOneLabel(from, graph.getState(target), true)) {
                graph.addEdge(source, target);
                neighbors_found++;
            }
        }
    }

    if (capped_sources > 0) {
        spdlog::debug("Similarity neighbor cap ({}) reached for {} states",
                      max_neighbors, capped_sources);
    }
}

} // namespace

const char* buildModeName(BuildMode mode) {
    switch (mode) {
        case BuildMode::TEMPORAL:   return "temporal";
        case BuildMode::SIMILARITY: return "similarity";
    }
    return "unknown";
}

BuildMode selectBuildMode(const std::vector<CanonicalRecord>& records) {
    std::unordered_map<std::string, size_t> per_machine;
    for (const auto& record : records) {
        if (++per_machine[record.machine_id] > 1) return BuildMode::TEMPORAL;
    }
    return BuildMode::SIMILARITY;
}

State discretizeRecord(const CanonicalRecord& record, const GraphConfig& config) {
    auto discretized = discretizeSensors(record.sensors, config.discretization);

    std::vector<std::string> labels;
    labels.reserve(config.state_components.size());
    for (const auto& sensor : config.state_components) {
        auto it = discretized.find(sensor);
        labels.push_back(it != discretized.end() ? it->second : kUnknownLabel);
    }
    return State(record.machine_id, std::move(labels));
}

StateGraph buildGraph(const std::vector<CanonicalRecord>& records,
                      const GraphConfig& config,
                      const GraphBuildOptions& options) {
    StateGraph graph;
    const BuildMode mode = selectBuildMode(records);
    const auto groups = groupByMachine(records);

    // Register every state first; temporal edges reuse the node ids.
    std::vector<std::vector<NodeId>> machine_sequences;
    machine_sequences.reserve(groups.size());

    for (const auto& group : groups) {
        std::vector<NodeId> sequence;
        sequence.reserve(group.records.size());
        for (const CanonicalRecord* record : group.records) {
            NodeId id = graph.addNode(discretizeRecord(*record, config));
            graph.attachRecord(id, *record);
            if (record->failure) {
                graph.markFailure(id);
            }
            sequence.push_back(id);
        }
        machine_sequences.push_back(std::move(sequence));
    }

    if (mode == BuildMode::TEMPORAL) {
        addTemporalEdges(graph, machine_sequences);
    } else {
        addSimilarityEdges(graph, options.max_similarity_neighbors);
    }

    spdlog::info("Built {} state graph from {} records across {} machines: "
                 "{} nodes, {} edges, {} failure states",
                 buildModeName(mode), records.size(), groups.size(),
                 graph.nodeCount(), graph.edgeCount(), graph.failureCount());
    return graph;
}

} // namespace precursor
