#include "io/csv_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace precursor {

namespace {

std::string trim(const std::string& value) {
    const auto begin = std::find_if_not(value.begin(), value.end(),
                                        [](unsigned char c) { return std::isspace(c) != 0; });
    const auto end = std::find_if_not(value.rbegin(), value.rend(),
                                      [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/// Split one CSV line. Double-quoted cells may contain commas and
/// escaped quotes ("").
std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); i++) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell.push_back('"');
                i++;
            } else if (c == '"') {
                quoted = false;
            } else {
                cell.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(trim(cell));
            cell.clear();
        } else {
            cell.push_back(c);
        }
    }
    cells.push_back(trim(cell));
    return cells;
}

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return std::nullopt;
    return value;
}

size_t requireColumn(const std::unordered_map<std::string, size_t>& header,
                     const std::string& name) {
    auto it = header.find(name);
    if (it == header.end()) {
        throw RecordError("Missing required column: " + name);
    }
    return it->second;
}

std::vector<CanonicalRecord> parseStream(std::istream& in, const CsvColumns& columns) {
    std::string line;
    if (!std::getline(in, line)) {
        throw RecordError("CSV input has no header row");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    const auto header_cells = splitCsvLine(line);
    std::unordered_map<std::string, size_t> header;
    for (size_t i = 0; i < header_cells.size(); i++) {
        header.emplace(header_cells[i], i);
    }

    const size_t machine_col = requireColumn(header, columns.machine_id_column);
    const size_t failure_col = requireColumn(header, columns.failure_column);
    const bool uses_time_column = columns.time_format != TimeKeyFormat::ROW_ORDER;
    const size_t time_col = uses_time_column ? requireColumn(header, columns.time_column) : 0;

    // sensor name → column index
    std::vector<std::pair<std::string, size_t>> sensors;
    if (columns.sensor_columns.empty()) {
        for (size_t i = 0; i < header_cells.size(); i++) {
            const auto& name = header_cells[i];
            if (name == columns.machine_id_column || name == columns.failure_column ||
                name == columns.time_column) {
                continue;
            }
            sensors.emplace_back(name, i);
        }
    } else {
        for (const auto& name : columns.sensor_columns) {
            auto it = header.find(name);
            if (it != header.end()) sensors.emplace_back(name, it->second);
        }
    }

    std::vector<CanonicalRecord> records;
    size_t row = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        const auto cells = splitCsvLine(line);
        auto cell = [&cells](size_t i) -> std::string {
            return i < cells.size() ? cells[i] : std::string();
        };

        CanonicalRecord record;
        record.machine_id = cell(machine_col);
        record.failure = parseFailureFlag(cell(failure_col));

        switch (columns.time_format) {
            case TimeKeyFormat::TIMESTAMP: {
                auto ts = parseIsoTimestamp(cell(time_col));
                if (!ts) throw RecordError("Could not parse timestamp: " + cell(time_col));
                record.time_key = *ts;
                break;
            }
            case TimeKeyFormat::NUMERIC: {
                auto value = parseNumber(cell(time_col));
                if (!value) throw RecordError("Could not parse time value: " + cell(time_col));
                record.time_key = *value;
                break;
            }
            case TimeKeyFormat::ROW_ORDER:
                record.time_key = static_cast<double>(row);
                break;
        }

        for (const auto& [name, index] : sensors) {
            if (auto value = parseNumber(cell(index))) {
                record.sensors.emplace(name, *value);
            }
        }

        records.push_back(std::move(record));
        row++;
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const CanonicalRecord& a, const CanonicalRecord& b) {
                         if (a.machine_id != b.machine_id) return a.machine_id < b.machine_id;
                         return a.time_key < b.time_key;
                     });
    return records;
}

} // namespace

std::optional<double> parseIsoTimestamp(const std::string& text) {
    std::string value = trim(text);
    if (value.size() < 10) return std::nullopt;

    // UTC offset: "Z", "+HH:MM", "-HHMM" or "+HH" after the date part.
    double offset_seconds = 0.0;
    if (value.back() == 'Z') {
        value.pop_back();
    } else {
        const auto sign = value.find_last_of("+-");
        if (sign != std::string::npos && sign > 10) {
            std::string digits = value.substr(sign + 1);
            digits.erase(std::remove(digits.begin(), digits.end(), ':'), digits.end());
            if ((digits.size() != 2 && digits.size() != 4) ||
                !std::all_of(digits.begin(), digits.end(),
                             [](unsigned char c) { return std::isdigit(c) != 0; })) {
                return std::nullopt;
            }
            const int hours = std::stoi(digits.substr(0, 2));
            const int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
            offset_seconds = (hours * 3600.0 + minutes * 60.0) * (value[sign] == '-' ? -1 : 1);
            value.erase(sign);
        }
    }

    double fraction = 0.0;
    const auto dot = value.find('.');
    if (dot != std::string::npos) {
        auto parsed = parseNumber("0" + value.substr(dot));
        if (!parsed) return std::nullopt;
        fraction = *parsed;
        value.erase(dot);
    }

    for (const char* format : {"%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S",
                               "%Y-%m-%d %H:%M", "%Y-%m-%dT%H:%M",
                               "%Y-%m-%d %H", "%Y-%m-%dT%H",
                               "%Y-%m-%d"}) {
        std::tm tm{};
        std::istringstream iss(value);
        iss >> std::get_time(&tm, format);
        if (iss.fail()) continue;
        iss >> std::ws;
        if (!iss.eof()) continue;
        return static_cast<double>(timegm(&tm)) + fraction - offset_seconds;
    }
    return std::nullopt;
}

bool parseFailureFlag(const std::string& text) {
    const std::string lower = toLower(trim(text));
    return lower == "1" || lower == "true" || lower == "yes";
}

std::vector<CanonicalRecord> loadTimestampedCsv(const std::string& path,
                                                const CsvColumns& columns) {
    std::ifstream in(path);
    if (!in) {
        throw RecordError("CSV file not found: " + path);
    }
    return parseStream(in, columns);
}

std::vector<CanonicalRecord> parseCsvRecords(const std::string& text,
                                             const CsvColumns& columns) {
    std::istringstream in(text);
    return parseStream(in, columns);
}

} // namespace precursor
