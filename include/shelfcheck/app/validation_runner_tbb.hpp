#pragma once

#include <shelfcheck/app/validation_runner.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <shelfcheck/engine/product_validator.hpp>
#include <cstddef>
#include <vector>

#ifdef SHELFCHECK_HAS_TBB

namespace shelfcheck::app {

/// Validates a batch in parallel using TBB.
///
/// The validator (and the catalog snapshot behind it) is shared read-only by every task;
/// no per-task copies are made. Each submission is validated exactly once and reported as
/// (index, outcome), failures included.
///
/// \param validator Shared validator. Caller keeps ownership.
/// \param submissions Read only; not modified.
/// \param callback May run on TBB worker threads; must be thread-safe.
/// \param num_workers Maximum concurrency of the arena the batch runs in; 0 = TBB default.
void run_validation_batch_tbb(const engine::ProductValidator& validator,
                              const std::vector<core::ProductSubmission>& submissions,
                              ValidationCallback callback,
                              std::size_t num_workers = 0);

}  // namespace shelfcheck::app

#endif  // SHELFCHECK_HAS_TBB
