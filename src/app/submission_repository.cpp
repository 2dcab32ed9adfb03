#include <shelfcheck/app/submission_repository.hpp>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace shelfcheck::app {

namespace {

void sort_newest_first(std::vector<Submission>& v) {
  std::sort(v.begin(), v.end(), [](const Submission& a, const Submission& b) {
    if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
    return a.id > b.id;
  });
}

}  // namespace

std::string utc_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms
     << 'Z';
  return os.str();
}

InMemorySubmissionRepository::InMemorySubmissionRepository(TimestampSource clock)
    : clock_(std::move(clock)) {
  if (!clock_) clock_ = utc_timestamp_now;
}

std::expected<Submission, core::Error> InMemorySubmissionRepository::append(NewSubmission submission) {
  std::lock_guard lock(mutex_);

  Submission s;
  s.id = next_id_;
  s.timestamp = clock_();
  s.product = std::move(submission.product);
  s.result = std::move(submission.result);
  s.result.neighbours.clear();
  s.accepted_changes = std::move(submission.accepted_changes);
  s.notes = std::move(submission.notes);
  s.flagged = requires_head_office_review(s.result);
  s.status = s.flagged ? SubmissionStatus::Pending : SubmissionStatus::Approved;

  by_id_.emplace(s.id, s);
  if (auto saved = persist(by_id_); !saved) {
    by_id_.erase(s.id);
    return std::unexpected(saved.error());
  }
  ++next_id_;
  return s;
}

std::optional<Submission> InMemorySubmissionRepository::get(std::uint64_t id) const {
  std::lock_guard lock(mutex_);
  auto it = by_id_.find(id);
  if (it == by_id_.end()) return std::nullopt;
  return it->second;
}

std::vector<Submission> InMemorySubmissionRepository::list_by_status(SubmissionStatus status) const {
  std::vector<Submission> out;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, s] : by_id_) {
      if (s.status == status) out.push_back(s);
    }
  }
  sort_newest_first(out);
  return out;
}

std::vector<Submission> InMemorySubmissionRepository::list_all() const {
  std::vector<Submission> out;
  {
    std::lock_guard lock(mutex_);
    out.reserve(by_id_.size());
    for (const auto& [id, s] : by_id_) out.push_back(s);
  }
  sort_newest_first(out);
  return out;
}

std::expected<Submission, core::Error> InMemorySubmissionRepository::set_status(
    std::uint64_t id, SubmissionStatus status, std::optional<std::string> reason) {
  std::lock_guard lock(mutex_);
  auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return std::unexpected(core::Error{core::ErrorKind::NotFound,
                                       "submission " + std::to_string(id) + " not found"});
  }

  const Submission previous = it->second;
  it->second.status = status;
  if (status == SubmissionStatus::Denied) {
    if (reason) it->second.denial_reason = std::move(reason);
  } else {
    it->second.denial_reason.reset();
  }

  if (auto saved = persist(by_id_); !saved) {
    it->second = previous;
    return std::unexpected(saved.error());
  }
  return it->second;
}

std::size_t InMemorySubmissionRepository::size() const {
  std::lock_guard lock(mutex_);
  return by_id_.size();
}

void InMemorySubmissionRepository::restore(std::vector<Submission> submissions) {
  std::lock_guard lock(mutex_);
  by_id_.clear();
  next_id_ = 1;
  for (auto& s : submissions) {
    const std::uint64_t id = s.id;
    next_id_ = std::max(next_id_, id + 1);
    by_id_.insert_or_assign(id, std::move(s));
  }
}

}  // namespace shelfcheck::app
