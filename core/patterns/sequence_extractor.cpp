#include "patterns/sequence_extractor.hpp"

#include <algorithm>
#include <unordered_map>

namespace precursor {

namespace {

struct SequenceHash {
    size_t operator()(const std::vector<State>& seq) const {
        StateHash hasher;
        size_t seed = seq.size();
        for (const auto& state : seq) {
            seed ^= hasher(state) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

} // namespace

std::vector<std::string> FailureSequence::describeStates() const {
    std::vector<std::string> out;
    out.reserve(states.size());
    for (const auto& state : states) {
        out.push_back(state.describe());
    }
    return out;
}

std::vector<FailureSequence> extractSequences(const std::vector<StatePath>& paths,
                                              int min_length) {
    std::vector<FailureSequence> results;
    // sequence → index into results (first-seen order)
    std::unordered_map<std::vector<State>, size_t, SequenceHash> index;

    for (const auto& path : paths) {
        if (path.empty()) continue;
        if (static_cast<int>(path.size()) < min_length) continue;

        std::vector<State> sequence(path.begin(), path.end() - 1);
        auto it = index.find(sequence);
        if (it == index.end()) {
            it = index.emplace(sequence, results.size()).first;
            FailureSequence entry;
            entry.states = std::move(sequence);
            results.push_back(std::move(entry));
        }

        FailureSequence& entry = results[it->second];
        entry.frequency++;
        entry.machines.insert(path.front().machine_id);
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const FailureSequence& a, const FailureSequence& b) {
                         return a.frequency > b.frequency;
                     });
    return results;
}

} // namespace precursor
