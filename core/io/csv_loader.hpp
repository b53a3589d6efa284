#pragma once

#include "graph/record.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace precursor {

/// Unreadable file, missing columns or an unparsable time value.
class RecordError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TimeKeyFormat {
    TIMESTAMP,   // ISO-8601 date-time, stored as UTC epoch seconds
    NUMERIC,     // elapsed runtime or any plain number
    ROW_ORDER    // position of the row in the file; time column ignored
};

struct CsvColumns {
    std::string time_column = "Timestamp";
    std::string machine_id_column = "Machine_ID";
    std::string failure_column = "Failure_Status";
    /// Empty: every column except the three above is a sensor.
    std::vector<std::string> sensor_columns;
    TimeKeyFormat time_format = TimeKeyFormat::TIMESTAMP;
};

/// Load a CSV with a header row into canonical records sorted by
/// (machine_id, time_key). Non-numeric sensor cells are skipped.
std::vector<CanonicalRecord> loadTimestampedCsv(const std::string& path,
                                                const CsvColumns& columns = {});

/// Same as loadTimestampedCsv, reading from an in-memory string.
std::vector<CanonicalRecord> parseCsvRecords(const std::string& text,
                                             const CsvColumns& columns = {});

/// ISO-8601 date or date-time: "2024-01-05", "2024-01-05 13:00",
/// "2024-01-05T13:00:00.250", with an optional "Z" or "+HH:MM"/"-HHMM"
/// offset. Date-only values are midnight. Returns UTC epoch seconds.
std::optional<double> parseIsoTimestamp(const std::string& text);

/// "1", "true", "yes" (any case) are failures; anything else is not.
bool parseFailureFlag(const std::string& text);

} // namespace precursor
