#pragma once

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace precursor {

// ─── Binning Scheme ────────────────────────────────────────────
// Ordered boundaries bins[0..n] and n labels. Label i covers the
// half-open interval [bins[i], bins[i+1]); the top interval is open
// upward, so any value >= bins[n] also maps to the last label.

struct BinningScheme {
    std::vector<double> bins;
    std::vector<std::string> labels;

    BinningScheme() = default;
    BinningScheme(std::vector<double> bins, std::vector<std::string> labels)
        : bins(std::move(bins)), labels(std::move(labels)) {}
};

/// Raised when a value lies below the lowest configured boundary.
class BinningRangeError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/// Map a raw sensor value to its bin label.
/// Throws BinningRangeError if value < bins[0].
std::string binValue(double value, const BinningScheme& scheme);

/// Discretize a full sensor reading. Only sensors present in both the
/// scheme map and the reading, and in range, appear in the result.
std::unordered_map<std::string, std::string> discretizeSensors(
    const std::unordered_map<std::string, double>& sensor_values,
    const std::unordered_map<std::string, BinningScheme>& schemes);

} // namespace precursor
