#pragma once

#include <shelfcheck/core/error.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <shelfcheck/core/validation_result.hpp>
#include <shelfcheck/engine/product_validator.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace shelfcheck::app {

using ValidationOutcome = std::expected<core::ValidationResult, core::Error>;

/// Callback for each submission: (index into the batch, outcome).
/// May be invoked from worker threads when using the parallel runners.
using ValidationCallback = std::function<void(std::size_t index, const ValidationOutcome&)>;

/// Validates a single submission. No threading; direct call.
/// If timing_cb is non-null, it is invoked for each phase with (phase, duration_ms).
[[nodiscard]] ValidationOutcome run_validation(const engine::ProductValidator& validator,
                                               const core::ProductSubmission& submission,
                                               engine::PhaseTimingCallback* timing_cb = nullptr);

/// Validates submissions sequentially, in order; calls callback for each outcome.
void run_validation_batch(const engine::ProductValidator& validator,
                          const std::vector<core::ProductSubmission>& submissions,
                          ValidationCallback callback);

/// Validates submissions on a pool of std::thread workers sharing the validator.
/// Callback may be invoked from any worker (must be thread-safe); order is not preserved,
/// use the index. num_workers 0 = use hardware concurrency.
void run_validation_batch_parallel(const engine::ProductValidator& validator,
                                   const std::vector<core::ProductSubmission>& submissions,
                                   ValidationCallback callback,
                                   std::size_t num_workers = 0);

/// Validates all submissions and returns outcomes in input order.
[[nodiscard]] std::vector<ValidationOutcome> validate_all(
    const engine::ProductValidator& validator,
    const std::vector<core::ProductSubmission>& submissions,
    std::size_t num_workers = 0);

}  // namespace shelfcheck::app
