// PyBind11 bindings for the precursor core.
// Exposes states, graph building, search, discovery, patterns and the
// pipeline runner to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DPRECURSOR_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "config/config_loader.hpp"
#include "discovery/failure_discovery.hpp"
#include "discovery/random_source.hpp"
#include "discretize/binning.hpp"
#include "graph/graph_builder.hpp"
#include "graph/record.hpp"
#include "graph/state.hpp"
#include "graph/state_graph.hpp"
#include "io/csv_loader.hpp"
#include "io/result_writer.hpp"
#include "patterns/sequence_extractor.hpp"
#include "patterns/warning_ranker.hpp"
#include "pipeline/runner.hpp"
#include "search/astar.hpp"
#include "search/breadth_first.hpp"
#include "search/depth_first.hpp"
#include "search/heuristics.hpp"
#include "search/search_controller.hpp"
#include "search/search_state.hpp"

namespace py = pybind11;

PYBIND11_MODULE(precursor_bindings, m) {
    m.doc() = "Failure-pattern discovery core bindings";

    py::register_exception<precursor::ConfigError>(m, "ConfigError");
    py::register_exception<precursor::RecordError>(m, "RecordError");
    py::register_exception<precursor::BinningRangeError>(m, "BinningRangeError");

    // ── Discretization ──
    py::class_<precursor::BinningScheme>(m, "BinningScheme")
        .def(py::init<>())
        .def(py::init<std::vector<double>, std::vector<std::string>>(),
             py::arg("bins"), py::arg("labels"))
        .def_readwrite("bins", &precursor::BinningScheme::bins)
        .def_readwrite("labels", &precursor::BinningScheme::labels);

    m.def("bin_value", &precursor::binValue, py::arg("value"), py::arg("scheme"));
    m.def("discretize_sensors", &precursor::discretizeSensors,
          py::arg("sensor_values"), py::arg("schemes"));

    // ── State ──
    py::class_<precursor::State>(m, "State")
        .def(py::init<>())
        .def(py::init<std::string, std::vector<std::string>>(),
             py::arg("machine_id"), py::arg("labels"))
        .def_readwrite("machine_id", &precursor::State::machine_id)
        .def_readwrite("labels", &precursor::State::labels)
        .def("describe", &precursor::State::describe)
        .def("__eq__", &precursor::State::operator==)
        .def("__hash__", [](const precursor::State& s) { return precursor::StateHash()(s); })
        .def("__repr__", &precursor::State::describe);

    // ── CanonicalRecord ──
    py::class_<precursor::CanonicalRecord>(m, "CanonicalRecord")
        .def(py::init<>())
        .def(py::init<std::string, double, std::unordered_map<std::string, double>, bool>(),
             py::arg("machine_id"), py::arg("time_key"), py::arg("sensors"), py::arg("failure"))
        .def_readwrite("machine_id", &precursor::CanonicalRecord::machine_id)
        .def_readwrite("time_key", &precursor::CanonicalRecord::time_key)
        .def_readwrite("sensors", &precursor::CanonicalRecord::sensors)
        .def_readwrite("failure", &precursor::CanonicalRecord::failure);

    // ── StateGraph ──
    py::class_<precursor::StateGraph>(m, "StateGraph")
        .def(py::init<>())
        .def("add_node", &precursor::StateGraph::addNode)
        .def("find_node", &precursor::StateGraph::findNode)
        .def("get_state", &precursor::StateGraph::getState,
             py::return_value_policy::reference_internal)
        .def("node_count", &precursor::StateGraph::nodeCount)
        .def("add_edge", py::overload_cast<const precursor::State&, const precursor::State&>(
                             &precursor::StateGraph::addEdge))
        .def("edge_count", &precursor::StateGraph::edgeCount)
        .def("mark_failure_state", &precursor::StateGraph::markFailureState)
        .def("is_failure", &precursor::StateGraph::isFailure)
        .def("is_failure_state", &precursor::StateGraph::isFailureState)
        .def("failure_nodes", &precursor::StateGraph::failureNodes)
        .def("get_successors", &precursor::StateGraph::getSuccessors)
        .def("get_predecessors", &precursor::StateGraph::getPredecessors)
        .def("get_neighbors", &precursor::StateGraph::getNeighbors)
        .def("get_records", &precursor::StateGraph::getRecords);

    // ── Graph building ──
    py::class_<precursor::GraphConfig>(m, "GraphConfig")
        .def(py::init<>())
        .def_readwrite("discretization", &precursor::GraphConfig::discretization)
        .def_readwrite("state_components", &precursor::GraphConfig::state_components);

    py::enum_<precursor::BuildMode>(m, "BuildMode")
        .value("TEMPORAL", precursor::BuildMode::TEMPORAL)
        .value("SIMILARITY", precursor::BuildMode::SIMILARITY);

    py::class_<precursor::GraphBuildOptions>(m, "GraphBuildOptions")
        .def(py::init<>())
        .def_readwrite("max_similarity_neighbors",
                       &precursor::GraphBuildOptions::max_similarity_neighbors);

    m.def("select_build_mode", &precursor::selectBuildMode);
    m.def("build_graph", &precursor::buildGraph,
          py::arg("records"), py::arg("config"),
          py::arg("options") = precursor::GraphBuildOptions{});

    // ── Search ──
    py::enum_<precursor::HeuristicKind>(m, "HeuristicKind")
        .value("TIME_TO_FAILURE", precursor::HeuristicKind::TIME_TO_FAILURE)
        .value("SENSOR_DISTANCE", precursor::HeuristicKind::SENSOR_DISTANCE);

    py::class_<precursor::SearchParams>(m, "SearchParams")
        .def(py::init<>())
        .def_readwrite("max_depth", &precursor::SearchParams::max_depth)
        .def_readwrite("lookback_window", &precursor::SearchParams::lookback_window)
        .def_readwrite("min_pattern_length", &precursor::SearchParams::min_pattern_length)
        .def_readwrite("heuristic", &precursor::SearchParams::heuristic)
        .def_readwrite("a_star_weight", &precursor::SearchParams::a_star_weight);

    m.def("bfs", [](const precursor::StateGraph& graph, precursor::NodeId start,
                    int max_depth, size_t max_paths) {
        return precursor::breadthFirstSearch(graph, start, precursor::failureGoal(graph),
                                             max_depth, max_paths);
    }, py::arg("graph"), py::arg("start"), py::arg("max_depth") = 50, py::arg("max_paths") = 10);

    m.def("dfs", [](const precursor::StateGraph& graph, precursor::NodeId start, int max_depth) {
        return precursor::depthFirstSearch(graph, start, precursor::failureGoal(graph), max_depth);
    }, py::arg("graph"), py::arg("start"), py::arg("max_depth") = 50);

    m.def("a_star", [](const precursor::StateGraph& graph, precursor::NodeId start,
                       precursor::HeuristicKind kind, int max_depth, double weight) {
        auto heuristic = precursor::makeHeuristic(kind);
        return precursor::aStarSearch(graph, start, precursor::failureGoal(graph),
                                      *heuristic, max_depth, weight);
    }, py::arg("graph"), py::arg("start"),
       py::arg("heuristic") = precursor::HeuristicKind::TIME_TO_FAILURE,
       py::arg("max_depth") = 50, py::arg("weight") = 1.0);

    py::class_<precursor::SearchController> controller(m, "SearchController");
    py::enum_<precursor::SearchController::Algorithm>(controller, "Algorithm")
        .value("BREADTH_FIRST", precursor::SearchController::Algorithm::BREADTH_FIRST)
        .value("DEPTH_FIRST", precursor::SearchController::Algorithm::DEPTH_FIRST)
        .value("A_STAR", precursor::SearchController::Algorithm::A_STAR);
    controller
        .def(py::init<precursor::SearchController::Algorithm>(),
             py::arg("algorithm") = precursor::SearchController::Algorithm::BREADTH_FIRST)
        .def("run", &precursor::SearchController::run,
             py::arg("graph"), py::arg("start"), py::arg("params"), py::arg("max_paths") = 10);

    // ── Discovery ──
    py::class_<precursor::DiscoveryOptions>(m, "DiscoveryOptions")
        .def(py::init<>())
        .def_readwrite("depth_cap", &precursor::DiscoveryOptions::depth_cap)
        .def_readwrite("max_paths_per_start", &precursor::DiscoveryOptions::max_paths_per_start)
        .def_readwrite("max_total_paths", &precursor::DiscoveryOptions::max_total_paths)
        .def_readwrite("fallback_sample_size", &precursor::DiscoveryOptions::fallback_sample_size)
        .def_readwrite("threads", &precursor::DiscoveryOptions::threads);

    py::class_<precursor::SeededRandomSource>(m, "SeededRandomSource")
        .def(py::init<uint32_t>(), py::arg("seed") = 42);

    m.def("discover_failure_paths",
          [](const precursor::StateGraph& graph, const precursor::SearchParams& params,
             uint32_t seed, const precursor::DiscoveryOptions& options) {
              precursor::SeededRandomSource random(seed);
              return precursor::discoverFailurePaths(graph, params, random, options);
          },
          py::arg("graph"), py::arg("params"), py::arg("seed") = 42,
          py::arg("options") = precursor::DiscoveryOptions{});

    // ── Patterns ──
    py::class_<precursor::FailureSequence>(m, "FailureSequence")
        .def(py::init<>())
        .def_readwrite("states", &precursor::FailureSequence::states)
        .def_readwrite("frequency", &precursor::FailureSequence::frequency)
        .def_readwrite("machines", &precursor::FailureSequence::machines)
        .def_readwrite("avg_time_to_failure", &precursor::FailureSequence::avg_time_to_failure)
        .def("describe_states", &precursor::FailureSequence::describeStates);

    py::class_<precursor::WarningSign>(m, "WarningSign")
        .def(py::init<>())
        .def_readwrite("pattern", &precursor::WarningSign::pattern)
        .def_readwrite("predictive_score", &precursor::WarningSign::predictive_score)
        .def_readwrite("frequency", &precursor::WarningSign::frequency)
        .def_readwrite("false_positive_rate", &precursor::WarningSign::false_positive_rate);

    m.def("extract_sequences", &precursor::extractSequences,
          py::arg("paths"), py::arg("min_length") = 3);
    m.def("rank_warning_signs", &precursor::rankWarningSigns, py::arg("sequences"));

    // ── Configuration and I/O ──
    m.def("load_graph_config", &precursor::loadGraphConfig, py::arg("path"));
    m.def("load_search_params", &precursor::loadSearchParams, py::arg("path"));
    m.def("load_timestamped_csv", [](const std::string& path) {
        return precursor::loadTimestampedCsv(path);
    }, py::arg("path"));
    m.def("write_sequences", &precursor::writeSequences, py::arg("path"), py::arg("sequences"));
    m.def("write_warning_signs", &precursor::writeWarningSigns,
          py::arg("path"), py::arg("warnings"));

    // ── Pipeline ──
    py::class_<precursor::PipelineOptions>(m, "PipelineOptions")
        .def(py::init<>())
        .def_readwrite("max_records", &precursor::PipelineOptions::max_records)
        .def_readwrite("build", &precursor::PipelineOptions::build)
        .def_readwrite("discovery", &precursor::PipelineOptions::discovery);

    py::class_<precursor::PipelineResult>(m, "PipelineResult")
        .def_readonly("record_count", &precursor::PipelineResult::record_count)
        .def_readonly("mode", &precursor::PipelineResult::mode)
        .def_readonly("graph", &precursor::PipelineResult::graph)
        .def_readonly("paths", &precursor::PipelineResult::paths)
        .def_readonly("sequences", &precursor::PipelineResult::sequences)
        .def_readonly("warnings", &precursor::PipelineResult::warnings);

    m.def("run_pipeline",
          [](const std::vector<precursor::CanonicalRecord>& records,
             const precursor::GraphConfig& config, const precursor::SearchParams& params,
             uint32_t seed, const precursor::PipelineOptions& options) {
              precursor::SeededRandomSource random(seed);
              return precursor::runPipeline(records, config, params, random, options);
          },
          py::arg("records"), py::arg("graph_config"), py::arg("params"),
          py::arg("seed") = 42, py::arg("options") = precursor::PipelineOptions{});

    m.def("run_pipeline_from_files",
          [](const std::string& data_path, const std::string& graph_config_path,
             const std::string& search_params_path, const std::string& output_dir,
             uint32_t seed) {
              precursor::SeededRandomSource random(seed);
              return precursor::runPipelineFromFiles(data_path, graph_config_path,
                                                     search_params_path, output_dir, random);
          },
          py::arg("data_path"), py::arg("graph_config_path"),
          py::arg("search_params_path"), py::arg("output_dir"), py::arg("seed") = 42);
}
