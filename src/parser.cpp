#include "vscore/parser.hpp"

#include <set>
#include <utility>
#include <vector>

#include "vscore/common.hpp"
#include "vscore/metric_table.hpp"

namespace vscore {

Version parse_version_tag(const std::string& tag) {
    if (tag == "CVSS:3.1") {
        return Version::kV3_1;
    }
    if (tag == "CVSS:4.0") {
        return Version::kV4_0;
    }
    if (tag.empty()) {
        throw VectorError(ErrorKind::kUnsupportedVersion, "vector is missing the CVSS version tag");
    }
    throw VectorError(ErrorKind::kUnsupportedVersion,
                      "unsupported version tag '" + tag + "', expected CVSS:3.1 or CVSS:4.0", {}, tag);
}

ParsedVector parse_vector(const std::string& text) {
    const auto trimmed = trim(text);
    auto segments = split(trimmed, '/');
    const auto version = parse_version_tag(segments.front());
    segments.erase(segments.begin());

    std::vector<std::pair<std::string, std::string>> pairs;
    std::set<std::string> seen;
    for (const auto& segment : segments) {
        const auto fields = split(segment, ':');
        if (fields.size() != 2 || fields[0].empty() || fields[1].empty()) {
            throw VectorError(ErrorKind::kMalformedSegment,
                              "malformed segment '" + segment + "', expected KEY:VALUE", {}, segment);
        }
        if (!seen.insert(fields[0]).second) {
            throw VectorError(ErrorKind::kDuplicateMetric, "metric " + fields[0] + " appears more than once",
                              fields[0]);
        }
        pairs.emplace_back(fields[0], fields[1]);
    }

    const auto& table = MetricTable::for_version(version);
    for (const auto& [key, value] : pairs) {
        if (table.find(key) == nullptr) {
            throw VectorError(ErrorKind::kUnknownMetric,
                              "unknown metric " + key + " for CVSS " + version_name(version), key, value);
        }
    }

    std::vector<std::string> missing;
    for (const auto& code : table.required_codes()) {
        if (seen.count(code) == 0) {
            missing.push_back(code);
        }
    }
    if (!missing.empty()) {
        throw VectorError(ErrorKind::kMissingRequiredMetric,
                          "missing required metrics: " + join(missing, ", "), {}, {}, missing);
    }

    ParsedVector parsed;
    parsed.version = version;
    for (const auto& [key, value] : pairs) {
        const auto& metric = table.at(key);
        if (!metric.allows(value)) {
            throw VectorError(ErrorKind::kInvalidMetricValue,
                              "invalid value '" + value + "' for " + metric_group_name(metric.group) +
                                  " metric " + key + " (" + metric.name +
                                  "), expected one of " + join(metric.value_codes(), "|"),
                              key, value);
        }
        parsed.metrics[key] = value;
    }
    for (const auto& metric : table.metrics()) {
        if (!metric.required) {
            parsed.metrics.emplace(metric.code, kNotDefined);
        }
    }
    return parsed;
}

std::optional<ParsedVector> try_parse_vector(const std::string& text) {
    try {
        return parse_vector(text);
    } catch (const VectorError&) {
        return std::nullopt;
    }
}

}  // namespace vscore
