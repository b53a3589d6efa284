#include "discovery/failure_discovery.hpp"

#include "search/breadth_first.hpp"
#include "search/path_budget.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

#include <spdlog/spdlog.h>

namespace precursor {

namespace {

std::vector<StatePath> searchSequential(const StateGraph& graph,
                                        const std::vector<NodeId>& starts,
                                        const GoalTest& goal,
                                        int depth,
                                        const DiscoveryOptions& options,
                                        PathBudget& budget) {
    std::vector<StatePath> paths;
    for (NodeId start : starts) {
        if (!budget.canContinue()) break;
        auto found = breadthFirstSearch(graph, start, goal, depth,
                                        options.max_paths_per_start);
        budget.recordPaths(found.size());
        for (auto& path : found) {
            paths.push_back(std::move(path));
        }
    }
    return paths;
}

std::vector<StatePath> searchParallel(const StateGraph& graph,
                                      const std::vector<NodeId>& starts,
                                      const GoalTest& goal,
                                      int depth,
                                      const DiscoveryOptions& options,
                                      PathBudget& budget) {
    // One slot per start state; each worker owns the slots it claims.
    std::vector<std::vector<StatePath>> per_start(starts.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (true) {
            const size_t i = next.fetch_add(1);
            if (i >= starts.size() || !budget.canContinue()) return;
            per_start[i] = breadthFirstSearch(graph, starts[i], goal, depth,
                                              options.max_paths_per_start);
            budget.recordPaths(per_start[i].size());
        }
    };

    const size_t thread_count = std::min<size_t>(options.threads, starts.size());
    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (size_t t = 0; t < thread_count; t++) {
        workers.emplace_back(worker);
    }
    for (auto& w : workers) {
        w.join();
    }

    std::vector<StatePath> paths;
    for (auto& found : per_start) {
        for (auto& path : found) {
            paths.push_back(std::move(path));
        }
    }
    return paths;
}

} // namespace

std::vector<NodeId> failurePrecursors(const StateGraph& graph) {
    std::vector<NodeId> result;
    graph.forEachNode([&](NodeId id, const State&) {
        if (graph.isFailure(id)) return;
        const auto& successors = graph.getSuccessors(id);
        if (std::any_of(successors.begin(), successors.end(),
                        [&graph](NodeId next) { return graph.isFailure(next); })) {
            result.push_back(id);
        }
    });
    return result;
}

std::vector<NodeId> selectStartStates(const StateGraph& graph,
                                      RandomSource& random,
                                      size_t fallback_sample_size) {
    auto starts = failurePrecursors(graph);
    if (!starts.empty()) return starts;

    std::vector<NodeId> candidates;
    graph.forEachNode([&](NodeId id, const State&) {
        if (!graph.isFailure(id)) candidates.push_back(id);
    });

    for (size_t i : random.sampleIndices(candidates.size(), fallback_sample_size)) {
        starts.push_back(candidates[i]);
    }
    spdlog::info("No state precedes a failure directly; sampled {} of {} "
                 "non-failure states as start states",
                 starts.size(), candidates.size());
    return starts;
}

std::vector<StatePath> discoverFailurePaths(const StateGraph& graph,
                                            const SearchParams& params,
                                            RandomSource& random,
                                            const DiscoveryOptions& options) {
    const auto starts = selectStartStates(graph, random, options.fallback_sample_size);
    const int depth = std::min(params.max_depth, options.depth_cap);
    const GoalTest goal = failureGoal(graph);
    PathBudget budget(options.max_total_paths);

    std::vector<StatePath> paths;
    if (options.threads > 1 && starts.size() > 1) {
        paths = searchParallel(graph, starts, goal, depth, options, budget);
    } else {
        paths = searchSequential(graph, starts, goal, depth, options, budget);
    }

    if (budget.isExhausted()) {
        spdlog::debug("Global path cap ({}) reached", options.max_total_paths);
    }
    spdlog::info("Discovered {} failure paths from {} start states (depth {})",
                 paths.size(), starts.size(), depth);
    return paths;
}

} // namespace precursor
