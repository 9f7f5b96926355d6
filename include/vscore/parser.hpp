#ifndef VSCORE_PARSER_HPP
#define VSCORE_PARSER_HPP

#include <optional>
#include <string>

#include "vscore/errors.hpp"
#include "vscore/types.hpp"

namespace vscore {

Version parse_version_tag(const std::string& tag);

// Throws VectorError. On success every metric of the version is present,
// optional metrics that were not supplied carry "X".
ParsedVector parse_vector(const std::string& text);

std::optional<ParsedVector> try_parse_vector(const std::string& text);

}  // namespace vscore

#endif  // VSCORE_PARSER_HPP
