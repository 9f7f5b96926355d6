#ifndef VSCORE_METRIC_TABLE_HPP
#define VSCORE_METRIC_TABLE_HPP

#include <optional>
#include <string>
#include <vector>

#include "vscore/types.hpp"

namespace vscore {

enum class MetricGroup {
    kBase,
    kTemporal,
    kThreat,
    kEnvironmental,
    kSupplemental,
};

struct MetricValueDef {
    std::string code;
    std::string name;
    double weight = 1.0;
    // Only privileges required differs when scope is changed (v3.1).
    std::optional<double> changed_scope_weight;
};

struct MetricDefinition {
    std::string code;
    std::string name;
    MetricGroup group = MetricGroup::kBase;
    bool required = false;
    // Base metric a modified metric falls back to; empty for everything else.
    std::string base_code;
    std::vector<MetricValueDef> values;

    bool allows(const std::string& value) const;
    const MetricValueDef& value(const std::string& value) const;
    std::vector<std::string> value_codes() const;
};

struct SeverityThresholds {
    double medium = 4.0;
    double high = 7.0;
    double critical = 9.0;
    double max_score = 10.0;
};

class MetricTable {
public:
    static const MetricTable& for_version(Version version);

    Version version() const { return version_; }
    const std::vector<MetricDefinition>& metrics() const { return metrics_; }
    const SeverityThresholds& severity_thresholds() const { return thresholds_; }

    const MetricDefinition* find(const std::string& code) const;
    const MetricDefinition& at(const std::string& code) const;

    // A base metric's lookup also covers the values only its modified
    // counterpart accepts, so merged environmental sets resolve.
    double weight(const std::string& code, const std::string& value) const;
    double scoped_weight(const std::string& code, const std::string& value, bool scope_changed) const;

    std::vector<std::string> codes(MetricGroup group) const;
    std::vector<std::string> required_codes() const;

private:
    MetricTable(Version version, std::vector<MetricDefinition> metrics, SeverityThresholds thresholds);

    const MetricValueDef& value_entry(const std::string& code, const std::string& value) const;

    Version version_;
    std::vector<MetricDefinition> metrics_;
    SeverityThresholds thresholds_;
};

std::string metric_group_name(MetricGroup group);

}  // namespace vscore

#endif  // VSCORE_METRIC_TABLE_HPP
