#include "patterns/warning_ranker.hpp"

#include <algorithm>

namespace precursor {

double WarningRanker::score(int frequency) const {
    return std::min(static_cast<double>(frequency) / saturation_, 1.0);
}

std::string WarningRanker::describe(const FailureSequence& sequence) const {
    if (sequence.states.empty()) return "Empty sequence";
    return "State transition: " + sequence.states.front().labelTuple() +
           " -> " + sequence.states.back().labelTuple() +
           " (" + std::to_string(sequence.states.size()) + " steps)";
}

std::vector<WarningSign> WarningRanker::rank(
    const std::vector<FailureSequence>& sequences) const {

    std::vector<WarningSign> signs;
    signs.reserve(sequences.size());
    for (const auto& seq : sequences) {
        WarningSign sign;
        sign.pattern = describe(seq);
        sign.predictive_score = score(seq.frequency);
        sign.frequency = seq.frequency;
        signs.push_back(std::move(sign));
    }

    std::stable_sort(signs.begin(), signs.end(),
                     [](const WarningSign& a, const WarningSign& b) {
                         return a.predictive_score > b.predictive_score;
                     });
    return signs;
}

std::vector<WarningSign> rankWarningSigns(const std::vector<FailureSequence>& sequences) {
    return WarningRanker().rank(sequences);
}

} // namespace precursor
