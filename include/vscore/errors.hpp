#ifndef VSCORE_ERRORS_HPP
#define VSCORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace vscore {

enum class ErrorKind {
    kUnsupportedVersion,
    kMalformedSegment,
    kDuplicateMetric,
    kUnknownMetric,
    kMissingRequiredMetric,
    kInvalidMetricValue,
    kEmptyVector,
};

std::string error_kind_name(ErrorKind kind);

class VectorError : public std::runtime_error {
public:
    VectorError(ErrorKind kind, const std::string& message, std::string metric = {},
                std::string value = {}, std::vector<std::string> missing = {});

    ErrorKind kind() const { return kind_; }
    const std::string& metric() const { return metric_; }
    const std::string& value() const { return value_; }
    const std::vector<std::string>& missing() const { return missing_; }

private:
    ErrorKind kind_;
    std::string metric_;
    std::string value_;
    std::vector<std::string> missing_;
};

}  // namespace vscore

#endif  // VSCORE_ERRORS_HPP
