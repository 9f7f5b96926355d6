#include "vscore/score_engine.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <utility>

#include "vscore/metric_table.hpp"
#include "vscore/parser.hpp"
#include "vscore/serializer.hpp"
#include "vscore/severity.hpp"

namespace vscore {

namespace {

constexpr double kMaxScore = 10.0;
constexpr double kExploitabilityCoeff = 8.22;
constexpr double kUnchangedImpactCoeff = 6.42;
constexpr double kChangedImpactCoeff = 7.52;
constexpr double kChangedImpactOffset = 0.029;
constexpr double kChangedImpactPenalty = 3.25;
constexpr double kChangedImpactBias = 0.02;
constexpr double kChangedScopeFactor = 1.08;
constexpr double kModifiedImpactCap = 0.915;
constexpr double kModifiedImpactScale = 0.9731;

const std::vector<std::string> kV3TemporalCodes = {"E", "RL", "RC"};
const std::vector<std::pair<std::string, std::string>> kV3RequirementPairs = {
    {"CR", "C"}, {"IR", "I"}, {"AR", "A"}};

bool scope_changed(const MetricSet& metrics) {
    return metrics.at("S") == "C";
}

double w(const MetricTable& table, const MetricSet& metrics, const std::string& code) {
    return table.weight(code, metrics.at(code));
}

double v3_exploitability(const MetricTable& table, const MetricSet& metrics) {
    const bool changed = scope_changed(metrics);
    return kExploitabilityCoeff * w(table, metrics, "AV") * w(table, metrics, "AC") *
           table.scoped_weight("PR", metrics.at("PR"), changed) * w(table, metrics, "UI");
}

double v3_impact(double isc, bool changed) {
    if (!changed) {
        return kUnchangedImpactCoeff * isc;
    }
    return kChangedImpactCoeff * (isc - kChangedImpactOffset) -
           kChangedImpactPenalty * std::pow(isc - kChangedImpactBias, 15.0);
}

double v3_modified_impact(double miss, bool changed) {
    if (!changed) {
        return kUnchangedImpactCoeff * miss;
    }
    return kChangedImpactCoeff * (miss - kChangedImpactOffset) -
           kChangedImpactPenalty * std::pow(miss * kModifiedImpactScale - kChangedImpactBias, 13.0);
}

double v3_combine(double impact, double exploitability, bool changed) {
    if (impact <= 0.0) {
        return 0.0;
    }
    const double factor = changed ? kChangedScopeFactor : 1.0;
    return round_up(std::min(factor * (impact + exploitability), kMaxScore));
}

BaseBreakdown v3_base(const MetricTable& table, const MetricSet& metrics) {
    const double isc = 1.0 - (1.0 - w(table, metrics, "C")) * (1.0 - w(table, metrics, "I")) *
                                 (1.0 - w(table, metrics, "A"));
    const bool changed = scope_changed(metrics);
    BaseBreakdown breakdown;
    breakdown.impact = v3_impact(isc, changed);
    breakdown.exploitability = v3_exploitability(table, metrics);
    breakdown.score = v3_combine(breakdown.impact, breakdown.exploitability, changed);
    return breakdown;
}

double v3_temporal_multiplier(const MetricTable& table, const MetricSet& metrics) {
    double multiplier = 1.0;
    for (const auto& code : kV3TemporalCodes) {
        multiplier *= w(table, metrics, code);
    }
    return multiplier;
}

double v3_environmental(const MetricTable& table, const MetricSet& metrics) {
    const auto merged = merge_modified_metrics(Version::kV3_1, metrics);
    const bool changed = scope_changed(merged);

    double unaffected = 1.0;
    for (const auto& [requirement, impact] : kV3RequirementPairs) {
        unaffected *= 1.0 - w(table, merged, requirement) * w(table, merged, impact);
    }
    const double miss = std::min(1.0 - unaffected, kModifiedImpactCap);
    const double impact = v3_modified_impact(miss, changed);
    const double exploitability = v3_exploitability(table, merged);
    const double modified_base = v3_combine(impact, exploitability, changed);
    return round_up(modified_base * v3_temporal_multiplier(table, metrics));
}

double max_weight(const MetricTable& table, const MetricSet& metrics, std::initializer_list<const char*> codes) {
    double best = 0.0;
    for (const char* code : codes) {
        best = std::max(best, w(table, metrics, code));
    }
    return best;
}

BaseBreakdown v4_base(const MetricTable& table, const MetricSet& metrics) {
    const double vulnerable = max_weight(table, metrics, {"VC", "VI", "VA"});
    const double subsequent = max_weight(table, metrics, {"SC", "SI", "SA"});
    BaseBreakdown breakdown;
    breakdown.impact = vulnerable + subsequent;
    breakdown.exploitability = kExploitabilityCoeff * w(table, metrics, "AV") * w(table, metrics, "AC") *
                               w(table, metrics, "AT") * w(table, metrics, "PR") * w(table, metrics, "UI");
    if (vulnerable <= 0.0 && subsequent <= 0.0) {
        breakdown.score = 0.0;
    } else {
        breakdown.score = round_up(std::min(breakdown.exploitability + breakdown.impact, kMaxScore));
    }
    return breakdown;
}

double v4_environmental(const MetricTable& table, const MetricSet& metrics) {
    const auto merged = merge_modified_metrics(Version::kV4_0, metrics);
    const double modified_base = v4_base(table, merged).score;
    const double requirement = max_weight(table, merged, {"CR", "IR", "AR"});
    return round_up(std::min(modified_base * requirement, kMaxScore));
}

ScoreResult score_v3_1(const ParsedVector& parsed) {
    const auto& table = MetricTable::for_version(Version::kV3_1);
    const auto& metrics = parsed.metrics;
    const auto breakdown = v3_base(table, metrics);

    ScoreResult result;
    result.version = Version::kV3_1;
    result.vector_string = serialize_vector(parsed);
    result.base_score = breakdown.score;
    result.base_severity = severity(breakdown.score);
    result.impact_score = breakdown.impact;
    result.exploitability_score = breakdown.exploitability;

    if (any_defined(metrics, table.codes(MetricGroup::kTemporal))) {
        result.temporal_score = round_up(breakdown.score * v3_temporal_multiplier(table, metrics));
        result.temporal_severity = severity(*result.temporal_score);
    }
    if (any_defined(metrics, table.codes(MetricGroup::kEnvironmental))) {
        result.environmental_score = v3_environmental(table, metrics);
        result.environmental_severity = severity(*result.environmental_score);
    }
    return result;
}

ScoreResult score_v4_0(const ParsedVector& parsed) {
    const auto& table = MetricTable::for_version(Version::kV4_0);
    const auto& metrics = parsed.metrics;
    const auto breakdown = v4_base(table, metrics);

    ScoreResult result;
    result.version = Version::kV4_0;
    result.vector_string = serialize_vector(parsed);
    result.base_score = breakdown.score;
    result.base_severity = severity(breakdown.score);
    result.impact_score = breakdown.impact;
    result.exploitability_score = breakdown.exploitability;

    if (any_defined(metrics, table.codes(MetricGroup::kThreat))) {
        result.threat_score = round_up(breakdown.score * w(table, metrics, "E"));
        result.threat_severity = severity(*result.threat_score);
    }
    if (any_defined(metrics, table.codes(MetricGroup::kEnvironmental))) {
        result.environmental_score = v4_environmental(table, metrics);
        result.environmental_severity = severity(*result.environmental_score);
    }
    for (const auto& code : table.codes(MetricGroup::kSupplemental)) {
        const auto& value = metrics.at(code);
        if (value != kNotDefined) {
            result.supplemental.emplace_back(code, value);
        }
    }
    return result;
}

}  // namespace

// Anything under 1e-5 above a tenth is binary noise and stays on that tenth.
double round_up(double value) {
    const long long scaled = std::llround(value * 100000.0);
    if (scaled % 10000 == 0) {
        return static_cast<double>(scaled) / 100000.0;
    }
    return (std::floor(static_cast<double>(scaled) / 10000.0) + 1.0) / 10.0;
}

bool any_defined(const MetricSet& metrics, const std::vector<std::string>& codes) {
    for (const auto& code : codes) {
        auto it = metrics.find(code);
        if (it != metrics.end() && it->second != kNotDefined) {
            return true;
        }
    }
    return false;
}

MetricSet merge_modified_metrics(Version version, const MetricSet& metrics) {
    const auto& table = MetricTable::for_version(version);
    MetricSet merged = metrics;
    for (const auto& metric : table.metrics()) {
        if (metric.base_code.empty()) {
            continue;
        }
        auto& modified = merged[metric.code];
        if (modified != kNotDefined) {
            merged[metric.base_code] = modified;
        }
        modified = kNotDefined;
    }
    return merged;
}

BaseBreakdown base_breakdown(Version version, const MetricSet& metrics) {
    const auto& table = MetricTable::for_version(version);
    switch (version) {
        case Version::kV3_1:
            return v3_base(table, metrics);
        case Version::kV4_0:
            return v4_base(table, metrics);
    }
    return BaseBreakdown{};
}

ScoreResult score(const ParsedVector& parsed) {
    switch (parsed.version) {
        case Version::kV3_1:
            return score_v3_1(parsed);
        case Version::kV4_0:
            return score_v4_0(parsed);
    }
    return score_v3_1(parsed);
}

ScoreResult score_vector(const std::string& text) {
    return score(parse_vector(text));
}

}  // namespace vscore
