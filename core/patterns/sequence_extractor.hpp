#pragma once

#include "graph/state.hpp"
#include "search/search_state.hpp"

#include <set>
#include <string>
#include <vector>

namespace precursor {

// ─── Failure Sequence ─────────────────────────────────────────
// A state sequence observed ahead of a failure, with the terminal
// failure state stripped.

struct FailureSequence {
    std::vector<State> states;
    int frequency = 0;
    std::set<std::string> machines;
    double avg_time_to_failure = 0.0;  // reserved, not computed

    /// Human-readable description of each state.
    std::vector<std::string> describeStates() const;
};

/// Aggregate discovered paths into failure sequences.
///
/// Paths with fewer than min_length states are dropped. The remaining
/// sequences are grouped by value, counted, and tagged with the machine
/// of each path's first state. Most frequent first; ties keep the order
/// in which the sequence was first seen.
std::vector<FailureSequence> extractSequences(const std::vector<StatePath>& paths,
                                              int min_length = 3);

} // namespace precursor
