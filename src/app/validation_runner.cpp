#include <shelfcheck/app/validation_runner.hpp>
#include <algorithm>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <utility>

namespace shelfcheck::app {

ValidationOutcome run_validation(const engine::ProductValidator& validator,
                                 const core::ProductSubmission& submission,
                                 engine::PhaseTimingCallback* timing_cb) {
  return validator.validate(submission, timing_cb);
}

void run_validation_batch(const engine::ProductValidator& validator,
                          const std::vector<core::ProductSubmission>& submissions,
                          ValidationCallback callback) {
  if (!callback) return;
  for (std::size_t i = 0; i < submissions.size(); ++i) {
    callback(i, validator.validate(submissions[i]));
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_validation_batch_parallel(const engine::ProductValidator& validator,
                                   const std::vector<core::ProductSubmission>& submissions,
                                   ValidationCallback callback,
                                   std::size_t num_workers) {
  const std::size_t n = submissions.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_validation_batch(validator, submissions, std::move(callback));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  // The queue is filled before any worker starts, so workers simply drain it.
  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      callback(idx, validator.validate(submissions[idx]));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

std::vector<ValidationOutcome> validate_all(const engine::ProductValidator& validator,
                                            const std::vector<core::ProductSubmission>& submissions,
                                            std::size_t num_workers) {
  std::vector<std::optional<ValidationOutcome>> slots(submissions.size());
  // Each index is written by exactly one worker; no lock needed.
  run_validation_batch_parallel(
      validator, submissions,
      [&slots](std::size_t i, const ValidationOutcome& outcome) { slots[i] = outcome; },
      num_workers);

  std::vector<ValidationOutcome> out;
  out.reserve(slots.size());
  for (auto& s : slots) out.push_back(std::move(*s));
  return out;
}

}  // namespace shelfcheck::app
