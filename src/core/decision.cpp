#include <shelfcheck/core/decision.hpp>
#include <shelfcheck/core/validation_result.hpp>

namespace shelfcheck::core {

std::string_view to_string(DecisionLevel level) noexcept {
  switch (level) {
    case DecisionLevel::Pass:
      return "pass";
    case DecisionLevel::Warning:
      return "warning";
    case DecisionLevel::HardStop:
      return "hard_stop";
  }
  return "pass";
}

std::optional<DecisionLevel> parse_decision_level(std::string_view text) noexcept {
  if (text == "pass") return DecisionLevel::Pass;
  if (text == "warning") return DecisionLevel::Warning;
  if (text == "hard_stop") return DecisionLevel::HardStop;
  return std::nullopt;
}

std::string_view overall_label(OverallVerdict verdict) noexcept {
  switch (verdict) {
    case OverallVerdict::Ready:
      return "Ready for automatic approval.";
    case OverallVerdict::WarningsPendingReview:
      return "Submitted with warnings; HO will review.";
    case OverallVerdict::RequiresCorrection:
      return "Requires correction before submission.";
  }
  return "";
}

std::string_view to_string(OverallVerdict verdict) noexcept {
  switch (verdict) {
    case OverallVerdict::Ready:
      return "ready";
    case OverallVerdict::WarningsPendingReview:
      return "warnings_pending_review";
    case OverallVerdict::RequiresCorrection:
      return "requires_correction";
  }
  return "ready";
}

std::optional<OverallVerdict> parse_overall_verdict(std::string_view text) noexcept {
  if (text == "ready") return OverallVerdict::Ready;
  if (text == "warnings_pending_review") return OverallVerdict::WarningsPendingReview;
  if (text == "requires_correction") return OverallVerdict::RequiresCorrection;
  return std::nullopt;
}

}  // namespace shelfcheck::core
