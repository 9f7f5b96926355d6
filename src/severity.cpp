#include "vscore/severity.hpp"

#include <cmath>
#include <stdexcept>

#include "vscore/metric_table.hpp"

namespace vscore {

Severity severity(double score) {
    // Both versions share the same thresholds.
    const auto& thresholds = MetricTable::for_version(Version::kV3_1).severity_thresholds();
    if (std::isnan(score) || score < 0.0 || score > thresholds.max_score) {
        throw std::out_of_range("score outside [0, 10]: " + std::to_string(score));
    }
    if (score == 0.0) {
        return Severity::kNone;
    }
    if (score < thresholds.medium) {
        return Severity::kLow;
    }
    if (score < thresholds.high) {
        return Severity::kMedium;
    }
    if (score < thresholds.critical) {
        return Severity::kHigh;
    }
    return Severity::kCritical;
}

std::string severity_name(Severity severity) {
    switch (severity) {
        case Severity::kNone:
            return "None";
        case Severity::kLow:
            return "Low";
        case Severity::kMedium:
            return "Medium";
        case Severity::kHigh:
            return "High";
        case Severity::kCritical:
            return "Critical";
    }
    return "None";
}

Severity parse_severity(const std::string& name) {
    if (name == "None") {
        return Severity::kNone;
    }
    if (name == "Low") {
        return Severity::kLow;
    }
    if (name == "Medium") {
        return Severity::kMedium;
    }
    if (name == "High") {
        return Severity::kHigh;
    }
    if (name == "Critical") {
        return Severity::kCritical;
    }
    throw std::runtime_error("unknown severity: " + name);
}

}  // namespace vscore
