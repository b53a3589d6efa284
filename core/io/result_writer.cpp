#include "io/result_writer.hpp"

#include <fstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace precursor {

namespace {

void writeText(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << text << "\n";
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

/// JSON-compatible output: flow collections, every string double quoted
/// so ids like "007" or "yes" stay strings, and doubles at 15 significant
/// digits so 0.1 prints as 0.1.
void configureJson(YAML::Emitter& out) {
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetDoublePrecision(15);
}

} // namespace

std::string emitSequences(const std::vector<FailureSequence>& sequences) {
    YAML::Emitter out;
    configureJson(out);
    out << YAML::BeginMap;
    out << YAML::Key << "sequences" << YAML::Value << YAML::BeginSeq;
    for (const auto& seq : sequences) {
        out << YAML::BeginMap;
        out << YAML::Key << "sequence" << YAML::Value << YAML::BeginSeq;
        for (const auto& text : seq.describeStates()) {
            out << text;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "frequency" << YAML::Value << seq.frequency;
        out << YAML::Key << "avg_time_to_failure" << YAML::Value << seq.avg_time_to_failure;
        out << YAML::Key << "machines" << YAML::Value << YAML::BeginSeq;
        for (const auto& machine : seq.machines) {
            out << machine;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

std::string emitWarningSigns(const std::vector<WarningSign>& warnings) {
    YAML::Emitter out;
    configureJson(out);
    out << YAML::BeginMap;
    out << YAML::Key << "warning_signs" << YAML::Value << YAML::BeginSeq;
    for (const auto& sign : warnings) {
        out << YAML::BeginMap;
        out << YAML::Key << "pattern" << YAML::Value << sign.pattern;
        out << YAML::Key << "predictive_score" << YAML::Value << sign.predictive_score;
        out << YAML::Key << "frequency" << YAML::Value << sign.frequency;
        out << YAML::Key << "false_positive_rate" << YAML::Value << sign.false_positive_rate;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

void writeSequences(const std::string& path, const std::vector<FailureSequence>& sequences) {
    writeText(path, emitSequences(sequences));
}

void writeWarningSigns(const std::string& path, const std::vector<WarningSign>& warnings) {
    writeText(path, emitWarningSigns(warnings));
}

} // namespace precursor
