#pragma once

#include "patterns/sequence_extractor.hpp"

#include <string>
#include <vector>

namespace precursor {

// ─── Warning Sign ─────────────────────────────────────────────
// A ranked, human-readable failure precursor.

struct WarningSign {
    std::string pattern;
    double predictive_score = 0.0;     // in [0, 1]
    int frequency = 0;
    double false_positive_rate = 0.0;  // reserved, always 0
};

// ─── Warning Ranker ───────────────────────────────────────────
// Scores sequences by frequency: score = min(frequency / saturation, 1).
// A sequence seen `saturation` times or more scores 1.0.

class WarningRanker {
public:
    explicit WarningRanker(double saturation = 10.0) : saturation_(saturation) {}

    /// Score and rank sequences, highest score first. Ties keep input order.
    std::vector<WarningSign> rank(const std::vector<FailureSequence>& sequences) const;

    double score(int frequency) const;

    /// "State transition: (a, b) -> (c, d) (n steps)"
    std::string describe(const FailureSequence& sequence) const;

    double saturation() const { return saturation_; }

private:
    double saturation_;
};

/// Rank with the default saturation of 10 occurrences.
std::vector<WarningSign> rankWarningSigns(const std::vector<FailureSequence>& sequences);

} // namespace precursor
