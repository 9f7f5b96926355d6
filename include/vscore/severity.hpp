#ifndef VSCORE_SEVERITY_HPP
#define VSCORE_SEVERITY_HPP

#include <string>

#include "vscore/types.hpp"

namespace vscore {

// Bands are half-open: 4.0, 7.0 and 9.0 belong to the higher band.
// Throws std::out_of_range for scores outside [0, 10].
Severity severity(double score);

std::string severity_name(Severity severity);
Severity parse_severity(const std::string& name);

}  // namespace vscore

#endif  // VSCORE_SEVERITY_HPP
