#include <shelfcheck/app/review_queue.hpp>
#include <algorithm>
#include <utility>

namespace shelfcheck::app {

namespace {

int level_score(core::DecisionLevel level) noexcept {
  switch (level) {
    case core::DecisionLevel::HardStop:
      return 2;
    case core::DecisionLevel::Warning:
      return 1;
    case core::DecisionLevel::Pass:
      return 0;
  }
  return 0;
}

}  // namespace

int risk_score(const core::ValidationResult& result) noexcept {
  return level_score(result.category.level) + level_score(result.price.level) +
         level_score(result.age_verification.level);
}

RiskLevel risk_level(int score) noexcept {
  if (score >= 3) return RiskLevel::High;
  if (score >= 1) return RiskLevel::Medium;
  return RiskLevel::Low;
}

std::string_view to_string(RiskLevel level) noexcept {
  switch (level) {
    case RiskLevel::Low:
      return "Low";
    case RiskLevel::Medium:
      return "Medium";
    case RiskLevel::High:
      return "High";
  }
  return "Low";
}

std::vector<ReviewItem> prepare_review_queue(std::vector<Submission> submissions) {
  std::vector<ReviewItem> queue;
  queue.reserve(submissions.size());
  for (auto& s : submissions) {
    const int score = risk_score(s.result);
    queue.push_back(ReviewItem{std::move(s), score, risk_level(score)});
  }
  std::stable_sort(queue.begin(), queue.end(), [](const ReviewItem& a, const ReviewItem& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.submission.timestamp > b.submission.timestamp;
  });
  return queue;
}

QueueSummary summarize(const std::vector<Submission>& submissions) noexcept {
  QueueSummary summary;
  for (const auto& s : submissions) {
    switch (s.status) {
      case SubmissionStatus::Pending:
        ++summary.pending;
        break;
      case SubmissionStatus::Approved:
        ++summary.approved;
        break;
      case SubmissionStatus::Denied:
        ++summary.denied;
        break;
    }
  }
  return summary;
}

}  // namespace shelfcheck::app
