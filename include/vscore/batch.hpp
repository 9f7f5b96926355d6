#ifndef VSCORE_BATCH_HPP
#define VSCORE_BATCH_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "vscore/config.hpp"
#include "vscore/errors.hpp"
#include "vscore/logging.hpp"
#include "vscore/types.hpp"

namespace vscore {

struct BatchOutcome {
    size_t row = 0;
    std::string input;
    std::optional<ScoreResult> result;
    std::optional<ErrorKind> error_kind;
    std::string error;

    bool ok() const { return result.has_value(); }
};

struct BatchSummary {
    size_t rows = 0;
    size_t scored = 0;
    size_t failed = 0;
};

// Scores one vector; parse failures become a failed outcome instead of an exception.
BatchOutcome score_row(size_t row, const std::string& input);

class BatchScorer {
public:
    explicit BatchScorer(BatchConfig config = {}, Logger logger = get_logger("BatchScorer"));

    // One outcome per input in input order. With fail_fast the list ends at
    // the first failed row.
    std::vector<BatchOutcome> score_all(const std::vector<std::string>& vectors) const;

private:
    BatchConfig config_;
    Logger logger_;
};

BatchSummary summarize(const std::vector<BatchOutcome>& outcomes);

}  // namespace vscore

#endif  // VSCORE_BATCH_HPP
