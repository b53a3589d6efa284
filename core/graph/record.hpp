#pragma once

#include <string>
#include <unordered_map>
#include <utility>

namespace precursor {

/// One historical sensor reading in canonical form, whatever the source
/// layout. time_key is epoch seconds, elapsed runtime, or a row index;
/// it only needs to be ordered within a machine.
struct CanonicalRecord {
    std::string machine_id;
    double time_key = 0.0;
    std::unordered_map<std::string, double> sensors;
    bool failure = false;

    CanonicalRecord() = default;
    CanonicalRecord(std::string machine_id, double time_key,
                    std::unordered_map<std::string, double> sensors, bool failure)
        : machine_id(std::move(machine_id)), time_key(time_key),
          sensors(std::move(sensors)), failure(failure) {}
};

} // namespace precursor
