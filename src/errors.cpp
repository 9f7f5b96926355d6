#include "vscore/errors.hpp"

#include <utility>

namespace vscore {

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kUnsupportedVersion:
            return "UnsupportedVersion";
        case ErrorKind::kMalformedSegment:
            return "MalformedSegment";
        case ErrorKind::kDuplicateMetric:
            return "DuplicateMetric";
        case ErrorKind::kUnknownMetric:
            return "UnknownMetric";
        case ErrorKind::kMissingRequiredMetric:
            return "MissingRequiredMetric";
        case ErrorKind::kInvalidMetricValue:
            return "InvalidMetricValue";
        case ErrorKind::kEmptyVector:
            return "EmptyVector";
    }
    return "UnknownError";
}

VectorError::VectorError(ErrorKind kind, const std::string& message, std::string metric,
                         std::string value, std::vector<std::string> missing)
    : std::runtime_error(message),
      kind_(kind),
      metric_(std::move(metric)),
      value_(std::move(value)),
      missing_(std::move(missing)) {}

}  // namespace vscore
