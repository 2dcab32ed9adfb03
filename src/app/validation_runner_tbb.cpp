#include <shelfcheck/app/validation_runner_tbb.hpp>

#ifdef SHELFCHECK_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <cstddef>

namespace shelfcheck::app {

void run_validation_batch_tbb(const engine::ProductValidator& validator,
                              const std::vector<core::ProductSubmission>& submissions,
                              ValidationCallback callback,
                              std::size_t num_workers) {
  if (submissions.empty() || !callback) return;

  const int concurrency =
      num_workers == 0 ? static_cast<int>(tbb::task_arena::automatic) : static_cast<int>(num_workers);
  tbb::task_arena arena(concurrency);
  arena.execute([&] {
    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, submissions.size()),
        [&validator, &submissions, &callback](const tbb::blocked_range<std::size_t>& range) {
          for (std::size_t i = range.begin(); i != range.end(); ++i) {
            callback(i, validator.validate(submissions[i]));
          }
        });
  });
}

}  // namespace shelfcheck::app

#endif  // SHELFCHECK_HAS_TBB
