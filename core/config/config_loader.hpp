#pragma once

#include "graph/graph_builder.hpp"
#include "search/search_state.hpp"

#include <stdexcept>
#include <string>

namespace precursor {

/// Malformed or unreadable graph/search configuration. Raised before
/// any graph construction starts.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Load a graph configuration file (YAML, or the equivalent JSON):
///
///   discretization:
///     Temperature: {bins: [0, 25, 50, 75, 100], labels: [low, medium, high, very_high]}
///   state_components: [Temperature]
GraphConfig loadGraphConfig(const std::string& path);
GraphConfig parseGraphConfig(const std::string& text);

/// Load search parameters; missing keys keep their defaults.
SearchParams loadSearchParams(const std::string& path);
SearchParams parseSearchParams(const std::string& text);

/// Throws ConfigError on mismatched bins/labels, non-increasing bins,
/// or a state component without a binning scheme.
void validateGraphConfig(const GraphConfig& config);
void validateSearchParams(const SearchParams& params);

HeuristicKind parseHeuristicKind(const std::string& name);
const char* heuristicKindName(HeuristicKind kind);

} // namespace precursor
