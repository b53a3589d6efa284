#include <gtest/gtest.h>
#include "graph/state_graph.hpp"
#include "search/astar.hpp"
#include "search/breadth_first.hpp"
#include "search/depth_first.hpp"
#include "search/heuristics.hpp"
#include "search/path_budget.hpp"
#include "search/search_controller.hpp"

#include <string>
#include <unordered_set>

using namespace precursor;

namespace {

State st(const std::string& label, const std::string& machine = "M1") {
    return State(machine, {label});
}

/// s0 → s1 → … → s(n-1), last one a failure.
StateGraph chain(int n) {
    StateGraph g;
    for (int i = 0; i + 1 < n; i++) {
        g.addEdge(st("s" + std::to_string(i)), st("s" + std::to_string(i + 1)));
    }
    g.markFailureState(st("s" + std::to_string(n - 1)));
    return g;
}

NodeId id(const StateGraph& g, const std::string& label) {
    return *g.findNode(st(label));
}

} // namespace

// ─── Breadth-first ─────────────────────────────────────────────

TEST(SearchTest, BfsFindsPathToGoal) {
    StateGraph g;
    g.addEdge(st("A"), st("B"));
    g.addEdge(st("B"), st("C"));
    g.markFailureState(st("C"));

    auto paths = breadthFirstSearch(g, id(g, "A"), failureGoal(g), 10);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (StatePath{st("A"), st("B"), st("C")}));
}

TEST(SearchTest, BfsRespectsMaxDepth) {
    StateGraph g = chain(10);
    EXPECT_TRUE(breadthFirstSearch(g, id(g, "s0"), failureGoal(g), 5).empty());

    auto paths = breadthFirstSearch(g, id(g, "s0"), failureGoal(g), 10);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0].size(), 10u);
    EXPECT_LE(paths[0].size(), 10u + 1u);
}

TEST(SearchTest, BfsDoesNotExpandGoals) {
    StateGraph g;
    g.addEdge(st("A"), st("F1"));
    g.addEdge(st("F1"), st("F2"));
    g.markFailureState(st("F1"));
    g.markFailureState(st("F2"));

    auto paths = breadthFirstSearch(g, id(g, "A"), failureGoal(g), 10);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0].back(), st("F1"));
}

TEST(SearchTest, BfsStopsAtMaxPaths) {
    StateGraph g;
    for (int i = 0; i < 5; i++) {
        std::string mid = "B" + std::to_string(i);
        std::string fail = "F" + std::to_string(i);
        g.addEdge(st("A"), st(mid));
        g.addEdge(st(mid), st(fail));
        g.markFailureState(st(fail));
    }

    EXPECT_EQ(breadthFirstSearch(g, id(g, "A"), failureGoal(g), 10, 10).size(), 5u);
    auto capped = breadthFirstSearch(g, id(g, "A"), failureGoal(g), 10, 3);
    ASSERT_EQ(capped.size(), 3u);
    EXPECT_EQ(capped[2], (StatePath{st("A"), st("B2"), st("F2")}));
}

TEST(SearchTest, BfsCollapsesSameDepthRoutesToOneGoal) {
    StateGraph g;
    for (int i = 0; i < 5; i++) {
        std::string mid = "B" + std::to_string(i);
        g.addEdge(st("A"), st(mid));
        g.addEdge(st(mid), st("F"));
    }
    g.markFailureState(st("F"));

    auto paths = breadthFirstSearch(g, id(g, "A"), failureGoal(g), 10, 10);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (StatePath{st("A"), st("B0"), st("F")}));
}

TEST(SearchTest, BfsReachesStateAgainAtDifferentDepth) {
    StateGraph g;
    g.addEdge(st("A"), st("B"));
    g.addEdge(st("A"), st("C"));
    g.addEdge(st("C"), st("B"));
    g.addEdge(st("B"), st("F"));
    g.markFailureState(st("F"));

    auto paths = breadthFirstSearch(g, id(g, "A"), failureGoal(g), 10);
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], (StatePath{st("A"), st("B"), st("F")}));
    EXPECT_EQ(paths[1], (StatePath{st("A"), st("C"), st("B"), st("F")}));
}

TEST(SearchTest, BfsStartingOnGoal) {
    StateGraph g;
    g.markFailureState(st("F"));
    auto paths = breadthFirstSearch(g, id(g, "F"), failureGoal(g), 10);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], StatePath{st("F")});
}

// ─── Depth-first ───────────────────────────────────────────────

TEST(SearchTest, DfsFindsPathsInAdjacencyOrder) {
    StateGraph g;
    g.addEdge(st("A"), st("B"));
    g.addEdge(st("A"), st("C"));
    g.addEdge(st("B"), st("F"));
    g.addEdge(st("C"), st("F"));
    g.markFailureState(st("F"));

    auto paths = depthFirstSearch(g, id(g, "A"), failureGoal(g), 10);
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], (StatePath{st("A"), st("B"), st("F")}));
    EXPECT_EQ(paths[1], (StatePath{st("A"), st("C"), st("F")}));
}

TEST(SearchTest, DfsAvoidsCycles) {
    StateGraph g;
    g.addEdge(st("A"), st("B"));
    g.addEdge(st("B"), st("A"));
    g.addEdge(st("B"), st("B"));
    g.addEdge(st("B"), st("F"));
    g.markFailureState(st("F"));

    auto paths = depthFirstSearch(g, id(g, "A"), failureGoal(g), 50);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (StatePath{st("A"), st("B"), st("F")}));
}

TEST(SearchTest, DfsRespectsMaxDepth) {
    StateGraph g = chain(10);
    EXPECT_TRUE(depthFirstSearch(g, id(g, "s0"), failureGoal(g), 5).empty());
    auto paths = depthFirstSearch(g, id(g, "s0"), failureGoal(g), 10);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0].size(), 10u);
}

TEST(SearchTest, DfsPathsAreSimpleOnDenseGraph) {
    StateGraph g;
    const std::vector<std::string> labels{"A", "B", "C", "D", "E"};
    for (const auto& from : labels) {
        for (const auto& to : labels) {
            g.addEdge(st(from), st(to));
        }
        g.addEdge(st(from), st("F"));
    }
    g.markFailureState(st("F"));

    const int max_depth = 4;
    auto paths = depthFirstSearch(g, id(g, "A"), failureGoal(g), max_depth);
    ASSERT_FALSE(paths.empty());
    for (const auto& path : paths) {
        EXPECT_LE(path.size(), static_cast<size_t>(max_depth) + 1);
        std::unordered_set<State, StateHash> seen(path.begin(), path.end());
        EXPECT_EQ(seen.size(), path.size());
        EXPECT_EQ(path.back(), st("F"));
    }
}

// ─── Heuristics ────────────────────────────────────────────────

TEST(SearchTest, ConstantHeuristic) {
    StateGraph g;
    g.addEdge(st("A"), st("F"));
    g.markFailureState(st("F"));

    ConstantHeuristic h;
    EXPECT_DOUBLE_EQ(h.estimate(g, id(g, "A")), 1.0);
    EXPECT_DOUBLE_EQ(h.estimate(g, id(g, "F")), 0.0);
    EXPECT_EQ(h.name(), "time_to_failure");
}

TEST(SearchTest, SensorDistanceHeuristic) {
    StateGraph g;
    NodeId current = g.addNode(State("M1", {"low", "low", "low"}));
    g.markFailureState(State("M1", {"high", "high", "low"}));
    g.markFailureState(State("M1", {"low", "high", "low"}));
    g.markFailureState(State("M2", {"low", "low", "high"}));  // other machine
    NodeId lonely = g.addNode(State("M3", {"low", "low", "low"}));

    SensorDistanceHeuristic h;
    EXPECT_DOUBLE_EQ(h.estimate(g, current), 1.0);
    EXPECT_DOUBLE_EQ(h.estimate(g, lonely), 10.0);
    EXPECT_DOUBLE_EQ(h.estimate(g, *g.findNode(State("M2", {"low", "low", "high"}))), 0.0);
    EXPECT_EQ(h.name(), "sensor_distance");
}

TEST(SearchTest, HeuristicFactory) {
    EXPECT_EQ(makeHeuristic(HeuristicKind::TIME_TO_FAILURE)->name(), "time_to_failure");
    EXPECT_EQ(makeHeuristic(HeuristicKind::SENSOR_DISTANCE)->name(), "sensor_distance");
}

// ─── A* ────────────────────────────────────────────────────────

TEST(SearchTest, AStarFindsUniqueShortestPath) {
    StateGraph g;
    g.addEdge(st("A"), st("C"));
    g.addEdge(st("C"), st("D"));
    g.addEdge(st("D"), st("F"));
    g.addEdge(st("A"), st("B"));
    g.addEdge(st("B"), st("F"));
    g.markFailureState(st("F"));

    ConstantHeuristic h;
    auto path = aStarSearch(g, id(g, "A"), failureGoal(g), h);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, (StatePath{st("A"), st("B"), st("F")}));
}

TEST(SearchTest, AStarReportsNoPath) {
    StateGraph g;
    g.addEdge(st("A"), st("B"));
    g.addEdge(st("B"), st("A"));
    g.markFailureState(st("F"));

    ConstantHeuristic h;
    EXPECT_FALSE(aStarSearch(g, id(g, "A"), failureGoal(g), h).has_value());
}

TEST(SearchTest, AStarTiesBreakByInsertionOrder) {
    StateGraph g;
    g.addEdge(st("A"), st("B"));
    g.addEdge(st("A"), st("C"));
    g.addEdge(st("B"), st("F1"));
    g.addEdge(st("C"), st("F2"));
    g.markFailureState(st("F1"));
    g.markFailureState(st("F2"));

    ConstantHeuristic h;
    for (int run = 0; run < 3; run++) {
        auto path = aStarSearch(g, id(g, "A"), failureGoal(g), h);
        ASSERT_TRUE(path.has_value());
        EXPECT_EQ(*path, (StatePath{st("A"), st("B"), st("F1")}));
    }
}

TEST(SearchTest, AStarRespectsMaxDepth) {
    StateGraph g = chain(3);
    ConstantHeuristic h;
    EXPECT_FALSE(aStarSearch(g, id(g, "s0"), failureGoal(g), h, 2).has_value());
    EXPECT_TRUE(aStarSearch(g, id(g, "s0"), failureGoal(g), h, 3).has_value());
}

TEST(SearchTest, AStarWithSensorDistanceAndWeight) {
    StateGraph g;
    State start("M1", {"low", "low"});
    State near("M1", {"low", "high"});
    State far("M1", {"mid", "low"});
    State fail("M1", {"high", "high"});
    g.addEdge(start, far);
    g.addEdge(start, near);
    g.addEdge(near, fail);
    g.addEdge(far, fail);
    g.markFailureState(fail);

    SensorDistanceHeuristic h;
    auto path = aStarSearch(g, *g.findNode(start), failureGoal(g), h, 50, 2.0);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, (StatePath{start, near, fail}));
}

// ─── Controller and budget ─────────────────────────────────────

TEST(SearchTest, ControllerDispatchesAllAlgorithms) {
    StateGraph g = chain(3);
    SearchParams params;
    params.max_depth = 10;

    for (auto algo : {SearchController::Algorithm::BREADTH_FIRST,
                      SearchController::Algorithm::DEPTH_FIRST,
                      SearchController::Algorithm::A_STAR}) {
        SearchController controller(algo);
        auto paths = controller.run(g, id(g, "s0"), params);
        ASSERT_EQ(paths.size(), 1u);
        EXPECT_EQ(paths[0], (StatePath{st("s0"), st("s1"), st("s2")}));
    }
}

TEST(SearchTest, PathBudgetCap) {
    PathBudget budget(5);
    EXPECT_TRUE(budget.canContinue());
    EXPECT_TRUE(budget.recordPaths(3));
    EXPECT_FALSE(budget.recordPaths(4));
    EXPECT_EQ(budget.accepted(), 7u);
    EXPECT_TRUE(budget.isExhausted());
}
