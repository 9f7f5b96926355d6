#include "vscore/metric_table.hpp"

#include <stdexcept>
#include <utility>

namespace vscore {

namespace {

MetricDefinition required_metric(std::string code, std::string name, std::vector<MetricValueDef> values) {
    return MetricDefinition{std::move(code), std::move(name), MetricGroup::kBase, true, {}, std::move(values)};
}

MetricDefinition optional_metric(std::string code, std::string name, MetricGroup group,
                                 std::vector<MetricValueDef> values, std::string base_code = {}) {
    values.insert(values.begin(), MetricValueDef{"X", "Not Defined", 1.0});
    return MetricDefinition{std::move(code), std::move(name), group, false, std::move(base_code),
                            std::move(values)};
}

// Modified counterpart of a base metric: same legal values, "X" falls back to the base metric.
MetricDefinition modified_metric(const MetricDefinition& base, std::vector<MetricValueDef> extra = {}) {
    auto values = base.values;
    values.insert(values.begin(), extra.begin(), extra.end());
    return optional_metric("M" + base.code, "Modified " + base.name, MetricGroup::kEnvironmental,
                           std::move(values), base.code);
}

std::vector<MetricValueDef> requirement_values() {
    return {{"H", "High", 1.5}, {"M", "Medium", 1.0}, {"L", "Low", 0.5}};
}

std::vector<MetricValueDef> v3_impact_values() {
    return {{"H", "High", 0.56}, {"L", "Low", 0.22}, {"N", "None", 0.0}};
}

std::vector<MetricDefinition> build_v3_1() {
    const auto attack_vector = required_metric(
        "AV", "Attack Vector",
        {{"N", "Network", 0.85}, {"A", "Adjacent Network", 0.62}, {"L", "Local", 0.55}, {"P", "Physical", 0.2}});
    const auto attack_complexity =
        required_metric("AC", "Attack Complexity", {{"L", "Low", 0.77}, {"H", "High", 0.44}});
    const auto privileges = required_metric(
        "PR", "Privileges Required",
        {{"N", "None", 0.85, 0.85}, {"L", "Low", 0.62, 0.68}, {"H", "High", 0.27, 0.5}});
    const auto user_interaction =
        required_metric("UI", "User Interaction", {{"N", "None", 0.85}, {"R", "Required", 0.62}});
    const auto scope = required_metric("S", "Scope", {{"U", "Unchanged"}, {"C", "Changed"}});
    const auto confidentiality = required_metric("C", "Confidentiality Impact", v3_impact_values());
    const auto integrity = required_metric("I", "Integrity Impact", v3_impact_values());
    const auto availability = required_metric("A", "Availability Impact", v3_impact_values());

    return {
        attack_vector,
        attack_complexity,
        privileges,
        user_interaction,
        scope,
        confidentiality,
        integrity,
        availability,
        optional_metric("E", "Exploit Code Maturity", MetricGroup::kTemporal,
                        {{"H", "High", 1.0},
                         {"F", "Functional", 0.97},
                         {"P", "Proof-of-Concept", 0.94},
                         {"U", "Unproven", 0.91}}),
        optional_metric("RL", "Remediation Level", MetricGroup::kTemporal,
                        {{"U", "Unavailable", 1.0},
                         {"W", "Workaround", 0.97},
                         {"T", "Temporary Fix", 0.96},
                         {"O", "Official Fix", 0.95}}),
        optional_metric("RC", "Report Confidence", MetricGroup::kTemporal,
                        {{"C", "Confirmed", 1.0}, {"R", "Reasonable", 0.96}, {"U", "Unknown", 0.92}}),
        optional_metric("CR", "Confidentiality Requirement", MetricGroup::kEnvironmental, requirement_values()),
        optional_metric("IR", "Integrity Requirement", MetricGroup::kEnvironmental, requirement_values()),
        optional_metric("AR", "Availability Requirement", MetricGroup::kEnvironmental, requirement_values()),
        modified_metric(attack_vector),
        modified_metric(attack_complexity),
        modified_metric(privileges),
        modified_metric(user_interaction),
        modified_metric(scope),
        modified_metric(confidentiality),
        modified_metric(integrity),
        modified_metric(availability),
    };
}

std::vector<MetricValueDef> vulnerable_impact_values() {
    return {{"H", "High", 5.5}, {"L", "Low", 2.2}, {"N", "None", 0.0}};
}

std::vector<MetricValueDef> subsequent_impact_values() {
    return {{"H", "High", 2.5}, {"L", "Low", 1.0}, {"N", "None", 0.0}};
}

std::vector<MetricDefinition> build_v4_0() {
    const auto attack_vector = required_metric(
        "AV", "Attack Vector",
        {{"N", "Network", 0.85}, {"A", "Adjacent", 0.62}, {"L", "Local", 0.55}, {"P", "Physical", 0.2}});
    const auto attack_complexity =
        required_metric("AC", "Attack Complexity", {{"L", "Low", 0.77}, {"H", "High", 0.44}});
    const auto attack_requirements =
        required_metric("AT", "Attack Requirements", {{"N", "None", 1.0}, {"P", "Present", 0.62}});
    const auto privileges =
        required_metric("PR", "Privileges Required", {{"N", "None", 0.85}, {"L", "Low", 0.62}, {"H", "High", 0.27}});
    const auto user_interaction = required_metric(
        "UI", "User Interaction", {{"N", "None", 0.85}, {"P", "Passive", 0.62}, {"A", "Active", 0.45}});
    const auto vc = required_metric("VC", "Vulnerable System Confidentiality Impact", vulnerable_impact_values());
    const auto vi = required_metric("VI", "Vulnerable System Integrity Impact", vulnerable_impact_values());
    const auto va = required_metric("VA", "Vulnerable System Availability Impact", vulnerable_impact_values());
    const auto sc = required_metric("SC", "Subsequent System Confidentiality Impact", subsequent_impact_values());
    const auto si = required_metric("SI", "Subsequent System Integrity Impact", subsequent_impact_values());
    const auto sa = required_metric("SA", "Subsequent System Availability Impact", subsequent_impact_values());
    const MetricValueDef safety{"S", "Safety", 3.5};

    return {
        attack_vector,
        attack_complexity,
        attack_requirements,
        privileges,
        user_interaction,
        vc,
        vi,
        va,
        sc,
        si,
        sa,
        optional_metric("E", "Exploit Maturity", MetricGroup::kThreat,
                        {{"A", "Attacked", 1.0}, {"P", "POC", 0.94}, {"U", "Unreported", 0.91}}),
        optional_metric("CR", "Confidentiality Requirement", MetricGroup::kEnvironmental, requirement_values()),
        optional_metric("IR", "Integrity Requirement", MetricGroup::kEnvironmental, requirement_values()),
        optional_metric("AR", "Availability Requirement", MetricGroup::kEnvironmental, requirement_values()),
        modified_metric(attack_vector),
        modified_metric(attack_complexity),
        modified_metric(attack_requirements),
        modified_metric(privileges),
        modified_metric(user_interaction),
        modified_metric(vc),
        modified_metric(vi),
        modified_metric(va),
        modified_metric(sc),
        modified_metric(si, {safety}),
        modified_metric(sa, {safety}),
        optional_metric("S", "Safety", MetricGroup::kSupplemental, {{"N", "Negligible"}, {"P", "Present"}}),
        optional_metric("AU", "Automatable", MetricGroup::kSupplemental, {{"N", "No"}, {"Y", "Yes"}}),
        optional_metric("R", "Recovery", MetricGroup::kSupplemental,
                        {{"A", "Automatic"}, {"U", "User"}, {"I", "Irrecoverable"}}),
        optional_metric("V", "Value Density", MetricGroup::kSupplemental, {{"D", "Diffuse"}, {"C", "Concentrated"}}),
        optional_metric("RE", "Vulnerability Response Effort", MetricGroup::kSupplemental,
                        {{"L", "Low"}, {"M", "Moderate"}, {"H", "High"}}),
        optional_metric("U", "Provider Urgency", MetricGroup::kSupplemental,
                        {{"Clear", "Clear"}, {"Green", "Green"}, {"Amber", "Amber"}, {"Red", "Red"}}),
    };
}

}  // namespace

bool MetricDefinition::allows(const std::string& value) const {
    for (const auto& candidate : values) {
        if (candidate.code == value) {
            return true;
        }
    }
    return false;
}

const MetricValueDef& MetricDefinition::value(const std::string& value) const {
    for (const auto& candidate : values) {
        if (candidate.code == value) {
            return candidate;
        }
    }
    throw std::out_of_range("metric " + code + " has no value " + value);
}

std::vector<std::string> MetricDefinition::value_codes() const {
    std::vector<std::string> output;
    output.reserve(values.size());
    for (const auto& candidate : values) {
        output.push_back(candidate.code);
    }
    return output;
}

MetricTable::MetricTable(Version version, std::vector<MetricDefinition> metrics, SeverityThresholds thresholds)
    : version_(version), metrics_(std::move(metrics)), thresholds_(thresholds) {}

const MetricTable& MetricTable::for_version(Version version) {
    static const MetricTable v3_1(Version::kV3_1, build_v3_1(), SeverityThresholds{});
    static const MetricTable v4_0(Version::kV4_0, build_v4_0(), SeverityThresholds{});
    switch (version) {
        case Version::kV3_1:
            return v3_1;
        case Version::kV4_0:
            return v4_0;
    }
    throw std::out_of_range("unsupported CVSS version");
}

const MetricDefinition* MetricTable::find(const std::string& code) const {
    for (const auto& metric : metrics_) {
        if (metric.code == code) {
            return &metric;
        }
    }
    return nullptr;
}

const MetricDefinition& MetricTable::at(const std::string& code) const {
    const auto* metric = find(code);
    if (metric == nullptr) {
        throw std::out_of_range("CVSS " + version_name(version_) + " has no metric " + code);
    }
    return *metric;
}

const MetricValueDef& MetricTable::value_entry(const std::string& code, const std::string& value) const {
    const auto& metric = at(code);
    if (metric.allows(value)) {
        return metric.value(value);
    }
    for (const auto& candidate : metrics_) {
        if (candidate.base_code == code && candidate.allows(value)) {
            return candidate.value(value);
        }
    }
    return metric.value(value);
}

double MetricTable::weight(const std::string& code, const std::string& value) const {
    return value_entry(code, value).weight;
}

double MetricTable::scoped_weight(const std::string& code, const std::string& value, bool scope_changed) const {
    const auto& entry = value_entry(code, value);
    if (scope_changed && entry.changed_scope_weight.has_value()) {
        return *entry.changed_scope_weight;
    }
    return entry.weight;
}

std::vector<std::string> MetricTable::codes(MetricGroup group) const {
    std::vector<std::string> output;
    for (const auto& metric : metrics_) {
        if (metric.group == group) {
            output.push_back(metric.code);
        }
    }
    return output;
}

std::vector<std::string> MetricTable::required_codes() const {
    std::vector<std::string> output;
    for (const auto& metric : metrics_) {
        if (metric.required) {
            output.push_back(metric.code);
        }
    }
    return output;
}

std::string metric_group_name(MetricGroup group) {
    switch (group) {
        case MetricGroup::kBase:
            return "base";
        case MetricGroup::kTemporal:
            return "temporal";
        case MetricGroup::kThreat:
            return "threat";
        case MetricGroup::kEnvironmental:
            return "environmental";
        case MetricGroup::kSupplemental:
            return "supplemental";
    }
    return "base";
}

}  // namespace vscore
