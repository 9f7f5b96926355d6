#ifndef VSCORE_SERIALIZER_HPP
#define VSCORE_SERIALIZER_HPP

#include <string>

#include "vscore/types.hpp"

namespace vscore {

// Canonical group order; optional metrics set to "X" are left out.
std::string serialize_vector(Version version, const MetricSet& metrics);
std::string serialize_vector(const ParsedVector& parsed);

}  // namespace vscore

#endif  // VSCORE_SERIALIZER_HPP
