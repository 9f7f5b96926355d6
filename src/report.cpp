#include "vscore/report.hpp"

#include <iomanip>
#include <optional>
#include <sstream>
#include <vector>

#include "vscore/common.hpp"
#include "vscore/metric_table.hpp"
#include "vscore/parser.hpp"
#include "vscore/severity.hpp"

namespace vscore {

namespace {

const std::vector<std::string> kCsvMetricColumns = {"AV", "AC", "PR", "UI"};

std::string format_fixed(double value, int precision) {
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(precision) << value;
    return stream.str();
}

std::string json_score(const std::optional<double>& score) {
    return score.has_value() ? format_score(*score) : "null";
}

std::string json_severity(const std::optional<Severity>& value) {
    return value.has_value() ? "\"" + severity_name(*value) + "\"" : "null";
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted += "\"";
    return quoted;
}

// Temporal for v3.1, threat for v4.0; at most one is ever set.
std::optional<double> adjusted_score(const ScoreResult& result) {
    return result.temporal_score.has_value() ? result.temporal_score : result.threat_score;
}

std::string metric_label(const ParsedVector& parsed, const std::string& code) {
    const auto& table = MetricTable::for_version(parsed.version);
    const auto& metric = table.at(code);
    return metric.value(parsed.metrics.at(code)).name;
}

}  // namespace

std::string format_score(double score) {
    return format_fixed(score, 1);
}

std::string format_text(const BatchOutcome& outcome, int precision) {
    std::ostringstream output;
    if (!outcome.ok()) {
        output << "row " << outcome.row << ": " << error_kind_name(*outcome.error_kind) << ": " << outcome.error;
        return output.str();
    }
    const auto& result = *outcome.result;
    output << result.vector_string << "\n";
    output << "  base " << format_score(result.base_score) << " (" << severity_name(result.base_severity) << ")"
           << "  impact " << format_fixed(result.impact_score, precision) << "  exploitability "
           << format_fixed(result.exploitability_score, precision);
    if (result.temporal_score.has_value()) {
        output << "\n  temporal " << format_score(*result.temporal_score) << " ("
               << severity_name(*result.temporal_severity) << ")";
    }
    if (result.threat_score.has_value()) {
        output << "\n  threat " << format_score(*result.threat_score) << " ("
               << severity_name(*result.threat_severity) << ")";
    }
    if (result.environmental_score.has_value()) {
        output << "\n  environmental " << format_score(*result.environmental_score) << " ("
               << severity_name(*result.environmental_severity) << ")";
    }
    if (!result.supplemental.empty()) {
        output << "\n  supplemental";
        for (const auto& [code, value] : result.supplemental) {
            output << " " << code << ":" << value;
        }
    }
    return output.str();
}

std::string format_json(const BatchOutcome& outcome, int precision) {
    std::ostringstream output;
    output << "{\"row\":" << outcome.row << ",\"input\":\"" << json_escape(outcome.input) << "\"";
    if (!outcome.ok()) {
        output << ",\"error\":{\"kind\":\"" << error_kind_name(*outcome.error_kind) << "\",\"message\":\""
               << json_escape(outcome.error) << "\"}}";
        return output.str();
    }
    const auto& result = *outcome.result;
    output << ",\"version\":\"" << version_name(result.version) << "\""
           << ",\"vector_string\":\"" << json_escape(result.vector_string) << "\""
           << ",\"base_score\":" << format_score(result.base_score)
           << ",\"base_severity\":\"" << severity_name(result.base_severity) << "\"";
    if (result.version == Version::kV3_1) {
        output << ",\"temporal_score\":" << json_score(result.temporal_score)
               << ",\"temporal_severity\":" << json_severity(result.temporal_severity);
    } else {
        output << ",\"threat_score\":" << json_score(result.threat_score)
               << ",\"threat_severity\":" << json_severity(result.threat_severity);
    }
    output << ",\"environmental_score\":" << json_score(result.environmental_score)
           << ",\"environmental_severity\":" << json_severity(result.environmental_severity);
    if (result.version == Version::kV4_0) {
        output << ",\"supplemental\":{";
        bool first = true;
        for (const auto& [code, value] : result.supplemental) {
            output << (first ? "" : ",") << "\"" << json_escape(code) << "\":\"" << json_escape(value) << "\"";
            first = false;
        }
        output << "}";
    }
    output << ",\"impact_score\":" << format_fixed(result.impact_score, precision)
           << ",\"exploitability_score\":" << format_fixed(result.exploitability_score, precision) << "}";
    return output.str();
}

std::string csv_header() {
    return "Row,CVSS Vector,Base Score,Severity,Temporal Score,Environmental Score,Attack Vector,"
           "Attack Complexity,Privileges Required,User Interaction,Impact Score,Exploitability Score,Error";
}

std::string format_csv_row(const BatchOutcome& outcome, int precision) {
    std::vector<std::string> fields;
    fields.push_back(std::to_string(outcome.row));
    if (!outcome.ok()) {
        fields.push_back(csv_field(outcome.input));
        fields.resize(fields.size() + 10);
        fields.push_back(csv_field(error_kind_name(*outcome.error_kind) + ": " + outcome.error));
        return join(fields, ",");
    }
    const auto& result = *outcome.result;
    const auto adjusted = adjusted_score(result);
    const auto parsed = parse_vector(result.vector_string);

    fields.push_back(csv_field(result.vector_string));
    fields.push_back(format_score(result.base_score));
    fields.push_back(severity_name(result.base_severity));
    fields.push_back(adjusted.has_value() ? format_score(*adjusted) : "");
    fields.push_back(result.environmental_score.has_value() ? format_score(*result.environmental_score) : "");
    for (const auto& code : kCsvMetricColumns) {
        fields.push_back(csv_field(metric_label(parsed, code)));
    }
    fields.push_back(format_fixed(result.impact_score, precision));
    fields.push_back(format_fixed(result.exploitability_score, precision));
    fields.emplace_back();
    return join(fields, ",");
}

std::string format_outcome(const BatchOutcome& outcome, const OutputConfig& config) {
    switch (config.format) {
        case OutputFormat::kText:
            return format_text(outcome, config.precision);
        case OutputFormat::kJson:
            return format_json(outcome, config.precision);
        case OutputFormat::kCsv:
            return format_csv_row(outcome, config.precision);
    }
    return format_text(outcome, config.precision);
}

}  // namespace vscore
