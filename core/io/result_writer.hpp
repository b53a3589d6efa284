#pragma once

#include "patterns/sequence_extractor.hpp"
#include "patterns/warning_ranker.hpp"

#include <string>
#include <vector>

namespace precursor {

/// JSON document (also valid YAML):
///   {"sequences": [{"sequence": ["State(machine=M1, bins=(low, high))", ...],
///                   "frequency": 3, "avg_time_to_failure": 0, "machines": ["M1"]}]}
std::string emitSequences(const std::vector<FailureSequence>& sequences);

///   {"warning_signs": [{"pattern": "State transition: (low) -> (high) (2 steps)",
///                       "predictive_score": 0.3, "frequency": 3,
///                       "false_positive_rate": 0}]}
std::string emitWarningSigns(const std::vector<WarningSign>& warnings);

/// Write the documents above to a file. Throws std::runtime_error when
/// the file cannot be written.
void writeSequences(const std::string& path, const std::vector<FailureSequence>& sequences);
void writeWarningSigns(const std::string& path, const std::vector<WarningSign>& warnings);

} // namespace precursor
