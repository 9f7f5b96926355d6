#ifndef VSCORE_TYPES_HPP
#define VSCORE_TYPES_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vscore {

enum class Version {
    kV3_1,
    kV4_0,
};

enum class Severity {
    kNone,
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

using MetricSet = std::map<std::string, std::string>;

// Value carried by an optional metric that was not supplied.
inline constexpr const char* kNotDefined = "X";

struct ParsedVector {
    Version version = Version::kV3_1;
    MetricSet metrics;

    bool operator==(const ParsedVector& other) const {
        return version == other.version && metrics == other.metrics;
    }
    bool operator!=(const ParsedVector& other) const { return !(*this == other); }
};

struct ScoreResult {
    Version version = Version::kV3_1;
    std::string vector_string;
    double base_score = 0.0;
    Severity base_severity = Severity::kNone;
    std::optional<double> temporal_score;
    std::optional<Severity> temporal_severity;
    std::optional<double> threat_score;
    std::optional<Severity> threat_severity;
    std::optional<double> environmental_score;
    std::optional<Severity> environmental_severity;
    std::vector<std::pair<std::string, std::string>> supplemental;
    double impact_score = 0.0;
    double exploitability_score = 0.0;
};

std::string version_tag(Version version);
std::string version_name(Version version);

}  // namespace vscore

#endif  // VSCORE_TYPES_HPP
