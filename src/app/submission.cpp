#include <shelfcheck/app/submission.hpp>
#include <shelfcheck/rules/decision_rules.hpp>
#include <initializer_list>

namespace shelfcheck::app {

std::string_view to_string(SubmissionStatus status) noexcept {
  switch (status) {
    case SubmissionStatus::Pending:
      return "pending";
    case SubmissionStatus::Approved:
      return "approved";
    case SubmissionStatus::Denied:
      return "denied";
  }
  return "pending";
}

std::optional<SubmissionStatus> parse_submission_status(std::string_view text) noexcept {
  if (text == "pending") return SubmissionStatus::Pending;
  if (text == "approved") return SubmissionStatus::Approved;
  if (text == "denied" || text == "rejected") return SubmissionStatus::Denied;
  return std::nullopt;
}

bool is_review_warning(const core::FieldDecision& decision) noexcept {
  if (decision.level != core::DecisionLevel::Warning) return false;
  if (!decision.confidence.has_value()) return false;
  return *decision.confidence < rules::kStrongConfidence;
}

bool requires_head_office_review(const core::ValidationResult& result) noexcept {
  for (const core::FieldDecision* d : {&result.category, &result.price, &result.age_verification}) {
    if (d->level == core::DecisionLevel::HardStop) return true;
    if (is_review_warning(*d)) return true;
  }
  return false;
}

}  // namespace shelfcheck::app
