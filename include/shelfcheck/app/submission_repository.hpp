#pragma once

#include <shelfcheck/app/submission.hpp>
#include <shelfcheck/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shelfcheck::app {

/// Source of submission timestamps; injectable for tests.
using TimestampSource = std::function<std::string()>;

/// Current UTC time as ISO 8601 with milliseconds, e.g. "2026-03-01T09:30:00.125Z".
[[nodiscard]] std::string utc_timestamp_now();

/// Store of validated submissions, keyed by a monotonically increasing id.
/// Implementations must be safe to call from multiple threads.
class ISubmissionRepository {
 public:
  virtual ~ISubmissionRepository() = default;

  /// Store a new submission. Status is Pending when the result needs head-office review
  /// (see requires_head_office_review), Approved otherwise.
  [[nodiscard]] virtual std::expected<Submission, core::Error> append(NewSubmission submission) = 0;

  [[nodiscard]] virtual std::optional<Submission> get(std::uint64_t id) const = 0;

  /// Submissions with the given status, newest first.
  [[nodiscard]] virtual std::vector<Submission> list_by_status(SubmissionStatus status) const = 0;

  /// All submissions, newest first.
  [[nodiscard]] virtual std::vector<Submission> list_all() const = 0;

  /// Fails with NotFound for an unknown id. reason is recorded for Denied only.
  [[nodiscard]] virtual std::expected<Submission, core::Error> set_status(
      std::uint64_t id,
      SubmissionStatus status,
      std::optional<std::string> reason = std::nullopt) = 0;

  [[nodiscard]] std::expected<Submission, core::Error> approve(std::uint64_t id) {
    return set_status(id, SubmissionStatus::Approved);
  }
  [[nodiscard]] std::expected<Submission, core::Error> deny(
      std::uint64_t id, std::optional<std::string> reason = std::nullopt) {
    return set_status(id, SubmissionStatus::Denied, std::move(reason));
  }
};

/// Mutex-guarded in-memory repository. Subclasses add durability through persist().
class InMemorySubmissionRepository : public ISubmissionRepository {
 public:
  explicit InMemorySubmissionRepository(TimestampSource clock = utc_timestamp_now);

  [[nodiscard]] std::expected<Submission, core::Error> append(NewSubmission submission) override;
  [[nodiscard]] std::optional<Submission> get(std::uint64_t id) const override;
  [[nodiscard]] std::vector<Submission> list_by_status(SubmissionStatus status) const override;
  [[nodiscard]] std::vector<Submission> list_all() const override;
  [[nodiscard]] std::expected<Submission, core::Error> set_status(
      std::uint64_t id,
      SubmissionStatus status,
      std::optional<std::string> reason = std::nullopt) override;

  [[nodiscard]] std::size_t size() const;

 protected:
  /// Called with the lock held after every mutation. On failure the mutation is undone
  /// and the error is returned to the caller.
  [[nodiscard]] virtual std::expected<void, core::Error> persist(
      const std::map<std::uint64_t, Submission>& /*submissions*/) {
    return {};
  }

  /// Replace the contents (used when loading from storage); next id = max id + 1.
  void restore(std::vector<Submission> submissions);

 private:
  mutable std::mutex mutex_;
  std::map<std::uint64_t, Submission> by_id_;
  std::uint64_t next_id_{1};
  TimestampSource clock_;
};

}  // namespace shelfcheck::app
