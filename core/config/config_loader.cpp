#include "config/config_loader.hpp"

#include <cmath>

#include <yaml-cpp/yaml.h>

namespace precursor {

namespace {

/// Helper to get optional int from YAML node
int get_int(const YAML::Node& node, const std::string& key, int default_value) {
    if (node[key] && node[key].IsScalar()) {
        return node[key].as<int>();
    }
    return default_value;
}

/// Helper to get optional double from YAML node
double get_double(const YAML::Node& node, const std::string& key, double default_value) {
    if (node[key] && node[key].IsScalar()) {
        return node[key].as<double>();
    }
    return default_value;
}

BinningScheme parse_scheme(const std::string& sensor, const YAML::Node& node) {
    if (!node.IsMap() || !node["bins"] || !node["labels"]) {
        throw ConfigError("Sensor '" + sensor + "' needs 'bins' and 'labels'");
    }
    if (!node["bins"].IsSequence() || !node["labels"].IsSequence()) {
        throw ConfigError("Sensor '" + sensor + "': 'bins' and 'labels' must be lists");
    }
    return BinningScheme(node["bins"].as<std::vector<double>>(),
                         node["labels"].as<std::vector<std::string>>());
}

GraphConfig parse_graph_config(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigError("Graph configuration must be a mapping");
    }
    const YAML::Node discretization = root["discretization"];
    if (!discretization || !discretization.IsMap()) {
        throw ConfigError("Graph configuration is missing 'discretization'");
    }
    const YAML::Node components = root["state_components"];
    if (!components || !components.IsSequence()) {
        throw ConfigError("Graph configuration is missing 'state_components'");
    }

    GraphConfig config;
    for (const auto& item : discretization) {
        const auto sensor = item.first.as<std::string>();
        config.discretization.emplace(sensor, parse_scheme(sensor, item.second));
    }
    config.state_components = components.as<std::vector<std::string>>();

    validateGraphConfig(config);
    return config;
}

SearchParams parse_search_params(const YAML::Node& root) {
    SearchParams params;
    if (!root || root.IsNull()) return params;
    if (!root.IsMap()) {
        throw ConfigError("Search parameters must be a mapping");
    }

    params.max_depth = get_int(root, "max_depth", params.max_depth);
    params.lookback_window = get_int(root, "lookback_window", params.lookback_window);
    params.min_pattern_length = get_int(root, "min_pattern_length", params.min_pattern_length);
    params.a_star_weight = get_double(root, "a_star_weight", params.a_star_weight);
    if (root["heuristic"]) {
        params.heuristic = parseHeuristicKind(root["heuristic"].as<std::string>());
    }

    validateSearchParams(params);
    return params;
}

} // namespace

GraphConfig loadGraphConfig(const std::string& path) {
    try {
        return parse_graph_config(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot load graph configuration '" + path + "': " + e.what());
    }
}

GraphConfig parseGraphConfig(const std::string& text) {
    try {
        return parse_graph_config(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid graph configuration: ") + e.what());
    }
}

SearchParams loadSearchParams(const std::string& path) {
    try {
        return parse_search_params(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot load search parameters '" + path + "': " + e.what());
    }
}

SearchParams parseSearchParams(const std::string& text) {
    try {
        return parse_search_params(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid search parameters: ") + e.what());
    }
}

void validateGraphConfig(const GraphConfig& config) {
    for (const auto& [sensor, scheme] : config.discretization) {
        if (scheme.labels.empty()) {
            throw ConfigError("Sensor '" + sensor + "' has no labels");
        }
        if (scheme.bins.size() != scheme.labels.size() + 1) {
            throw ConfigError("Sensor '" + sensor + "' has " +
                              std::to_string(scheme.bins.size()) + " bins for " +
                              std::to_string(scheme.labels.size()) +
                              " labels; expected one more bin than labels");
        }
        for (size_t i = 0; i + 1 < scheme.bins.size(); i++) {
            if (!(scheme.bins[i] < scheme.bins[i + 1])) {
                throw ConfigError("Sensor '" + sensor + "' bins must be strictly increasing");
            }
        }
    }

    if (config.state_components.empty()) {
        throw ConfigError("At least one state component is required");
    }
    for (const auto& component : config.state_components) {
        if (!config.discretization.count(component)) {
            throw ConfigError("State component '" + component +
                              "' has no discretization entry");
        }
    }
}

void validateSearchParams(const SearchParams& params) {
    if (params.max_depth <= 0) {
        throw ConfigError("max_depth must be greater than 0");
    }
    if (params.lookback_window <= 0) {
        throw ConfigError("lookback_window must be greater than 0");
    }
    if (params.min_pattern_length < 1) {
        throw ConfigError("min_pattern_length must be at least 1");
    }
    if (!std::isfinite(params.a_star_weight) || params.a_star_weight <= 0.0) {
        throw ConfigError("a_star_weight must be a positive number");
    }
}

HeuristicKind parseHeuristicKind(const std::string& name) {
    if (name == "time_to_failure") return HeuristicKind::TIME_TO_FAILURE;
    if (name == "sensor_distance") return HeuristicKind::SENSOR_DISTANCE;
    throw ConfigError("Unknown heuristic: " + name);
}

const char* heuristicKindName(HeuristicKind kind) {
    switch (kind) {
        case HeuristicKind::TIME_TO_FAILURE: return "time_to_failure";
        case HeuristicKind::SENSOR_DISTANCE: return "sensor_distance";
    }
    return "unknown";
}

} // namespace precursor
