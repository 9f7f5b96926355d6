#include "vscore/serializer.hpp"

#include <vector>

#include "vscore/common.hpp"
#include "vscore/metric_table.hpp"

namespace vscore {

std::string serialize_vector(Version version, const MetricSet& metrics) {
    const auto& table = MetricTable::for_version(version);
    std::vector<std::string> parts{version_tag(version)};
    for (const auto& metric : table.metrics()) {
        auto it = metrics.find(metric.code);
        if (it == metrics.end()) {
            continue;
        }
        if (!metric.required && it->second == kNotDefined) {
            continue;
        }
        parts.push_back(metric.code + ":" + it->second);
    }
    return join(parts, "/");
}

std::string serialize_vector(const ParsedVector& parsed) {
    return serialize_vector(parsed.version, parsed.metrics);
}

}  // namespace vscore
