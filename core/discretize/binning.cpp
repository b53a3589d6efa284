#include "discretize/binning.hpp"

namespace precursor {

std::string binValue(double value, const BinningScheme& scheme) {
    if (scheme.labels.empty() || scheme.bins.size() != scheme.labels.size() + 1) {
        throw std::invalid_argument("Binning scheme needs exactly one more boundary than labels");
    }

    for (size_t i = 0; i + 1 < scheme.bins.size(); i++) {
        if (scheme.bins[i] <= value && value < scheme.bins[i + 1]) {
            return scheme.labels[i];
        }
    }

    if (value >= scheme.bins.back()) {
        return scheme.labels.back();
    }

    throw BinningRangeError("Value " + std::to_string(value) +
                            " is below minimum bin boundary " +
                            std::to_string(scheme.bins.front()));
}

std::unordered_map<std::string, std::string> discretizeSensors(
    const std::unordered_map<std::string, double>& sensor_values,
    const std::unordered_map<std::string, BinningScheme>& schemes) {

    std::unordered_map<std::string, std::string> result;
    for (const auto& [sensor, scheme] : schemes) {
        auto it = sensor_values.find(sensor);
        if (it == sensor_values.end()) continue;
        try {
            result.emplace(sensor, binValue(it->second, scheme));
        } catch (const BinningRangeError&) {
            // Out-of-range readings fall back to the "unknown" label.
            continue;
        }
    }
    return result;
}

} // namespace precursor
