#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace precursor {

/// Placeholder label for a state component with no in-range reading.
inline constexpr const char* kUnknownLabel = "unknown";

/// A discretized equipment condition: one bin label per configured
/// state component, scoped to a single machine. Two states with equal
/// machine id and labels are the same graph node.
struct State {
    std::string machine_id;
    std::vector<std::string> labels;

    State() = default;
    State(std::string machine_id, std::vector<std::string> labels)
        : machine_id(std::move(machine_id)), labels(std::move(labels)) {}

    bool operator==(const State& other) const {
        return machine_id == other.machine_id && labels == other.labels;
    }
    bool operator!=(const State& other) const { return !(*this == other); }

    /// "(low, high)"
    std::string labelTuple() const;

    /// "State(machine=M1, bins=(low, high))"
    std::string describe() const;
};

struct StateHash {
    size_t operator()(const State& state) const;
};

/// Number of label positions that differ. Tuples of unequal length are
/// never comparable and report SIZE_MAX.
size_t hammingDistance(const State& a, const State& b);

/// True when the two label tuples differ in exactly one position.
bool differsByOneLabel(const State& a, const State& b, bool ignore_machine_id = false);

} // namespace precursor
