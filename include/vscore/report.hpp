#ifndef VSCORE_REPORT_HPP
#define VSCORE_REPORT_HPP

#include <string>

#include "vscore/batch.hpp"
#include "vscore/config.hpp"

namespace vscore {

std::string format_score(double score);
std::string format_text(const BatchOutcome& outcome, int precision = 4);
std::string format_json(const BatchOutcome& outcome, int precision = 4);
std::string csv_header();
std::string format_csv_row(const BatchOutcome& outcome, int precision = 4);
std::string format_outcome(const BatchOutcome& outcome, const OutputConfig& config);

}  // namespace vscore

#endif  // VSCORE_REPORT_HPP
