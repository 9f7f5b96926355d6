#ifndef VSCORE_SCORE_ENGINE_HPP
#define VSCORE_SCORE_ENGINE_HPP

#include <string>
#include <vector>

#include "vscore/types.hpp"

namespace vscore {

struct BaseBreakdown {
    double impact = 0.0;
    double exploitability = 0.0;
    double score = 0.0;
};

// ceil(value * 10) / 10, evaluated on value rounded to five decimals. Inputs
// less than 1e-5 above a tenth round down to it, so the result is only
// guaranteed to be >= value - 1e-5.
double round_up(double value);

bool any_defined(const MetricSet& metrics, const std::vector<std::string>& codes);

// Resolves every modified metric onto its base counterpart ("X" keeps the base value).
// The returned set holds no defined modified metrics; requirements and
// temporal/threat metrics are carried over unchanged.
MetricSet merge_modified_metrics(Version version, const MetricSet& metrics);

BaseBreakdown base_breakdown(Version version, const MetricSet& metrics);

// Metrics must come from parse_vector; scoring a validated set cannot fail.
ScoreResult score(const ParsedVector& parsed);
ScoreResult score_vector(const std::string& text);

}  // namespace vscore

#endif  // VSCORE_SCORE_ENGINE_HPP
