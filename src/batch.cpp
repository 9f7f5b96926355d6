#include "vscore/batch.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <limits>
#include <thread>
#include <utility>

#include "vscore/common.hpp"
#include "vscore/score_engine.hpp"

namespace vscore {

namespace {

constexpr size_t kNoFailure = std::numeric_limits<size_t>::max();

void lower_to(std::atomic<size_t>& target, size_t value) {
    size_t current = target.load();
    while (value < current && !target.compare_exchange_weak(current, value)) {
    }
}

}  // namespace

BatchOutcome score_row(size_t row, const std::string& input) {
    BatchOutcome outcome;
    outcome.row = row;
    outcome.input = input;
    if (trim(input).empty()) {
        outcome.error_kind = ErrorKind::kEmptyVector;
        outcome.error = "no vector supplied";
        return outcome;
    }
    try {
        outcome.result = score_vector(input);
    } catch (const VectorError& exc) {
        outcome.error_kind = exc.kind();
        outcome.error = exc.what();
    }
    return outcome;
}

BatchScorer::BatchScorer(BatchConfig config, Logger logger) : config_(config), logger_(std::move(logger)) {}

std::vector<BatchOutcome> BatchScorer::score_all(const std::vector<std::string>& vectors) const {
    std::vector<std::optional<BatchOutcome>> slots(vectors.size());
    std::atomic<size_t> first_failure{kNoFailure};

    auto run_rows = [&](size_t start, size_t stride) {
        for (size_t index = start; index < vectors.size(); index += stride) {
            if (config_.fail_fast && index > first_failure.load()) {
                return;
            }
            auto outcome = score_row(index + 1, vectors[index]);
            if (!outcome.ok()) {
                logger_.warn("row_failed", {{"row", std::to_string(outcome.row)},
                                            {"kind", error_kind_name(*outcome.error_kind)},
                                            {"error", outcome.error}});
                lower_to(first_failure, index);
            } else if (logger_.enabled(LogLevel::kDebug)) {
                logger_.debug("row_scored", {{"row", std::to_string(outcome.row)},
                                             {"vector", outcome.result->vector_string},
                                             {"base_score", std::to_string(outcome.result->base_score)}});
            }
            slots[index] = std::move(outcome);
        }
    };

    const size_t workers =
        std::max<size_t>(1, std::min<size_t>(static_cast<size_t>(std::max(config_.workers, 1)), vectors.size()));
    if (workers <= 1) {
        run_rows(0, 1);
    } else {
        std::vector<std::thread> threads;
        std::vector<std::exception_ptr> errors(workers);
        threads.reserve(workers);
        for (size_t worker = 0; worker < workers; ++worker) {
            threads.emplace_back([&, worker]() {
                try {
                    run_rows(worker, workers);
                } catch (...) {
                    errors[worker] = std::current_exception();
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    std::vector<BatchOutcome> outcomes;
    outcomes.reserve(vectors.size());
    for (size_t index = 0; index < slots.size(); ++index) {
        if (config_.fail_fast && index > first_failure.load()) {
            break;
        }
        outcomes.push_back(std::move(*slots[index]));
    }

    const auto summary = summarize(outcomes);
    logger_.info("batch_complete", {{"rows", std::to_string(summary.rows)},
                                    {"scored", std::to_string(summary.scored)},
                                    {"failed", std::to_string(summary.failed)},
                                    {"workers", std::to_string(workers)}});
    return outcomes;
}

BatchSummary summarize(const std::vector<BatchOutcome>& outcomes) {
    BatchSummary summary;
    summary.rows = outcomes.size();
    for (const auto& outcome : outcomes) {
        if (outcome.ok()) {
            summary.scored += 1;
        } else {
            summary.failed += 1;
        }
    }
    return summary;
}

}  // namespace vscore
