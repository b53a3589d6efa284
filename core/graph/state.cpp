#include "graph/state.hpp"

#include <functional>
#include <limits>
#include <sstream>

namespace precursor {

std::string State::labelTuple() const {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < labels.size(); i++) {
        if (i > 0) oss << ", ";
        oss << labels[i];
    }
    oss << ")";
    return oss.str();
}

std::string State::describe() const {
    return "State(machine=" + machine_id + ", bins=" + labelTuple() + ")";
}

size_t StateHash::operator()(const State& state) const {
    std::hash<std::string> hasher;
    size_t seed = hasher(state.machine_id);
    for (const auto& label : state.labels) {
        seed ^= hasher(label) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

size_t hammingDistance(const State& a, const State& b) {
    if (a.labels.size() != b.labels.size()) {
        return std::numeric_limits<size_t>::max();
    }
    size_t distance = 0;
    for (size_t i = 0; i < a.labels.size(); i++) {
        if (a.labels[i] != b.labels[i]) distance++;
    }
    return distance;
}

bool differsByOneLabel(const State& a, const State& b, bool ignore_machine_id) {
    if (!ignore_machine_id && a.machine_id != b.machine_id) return false;
    return hammingDistance(a, b) == 1;
}

} // namespace precursor
