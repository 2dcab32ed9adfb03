#include <shelfcheck/rules/aggregator.hpp>

namespace shelfcheck::rules {

core::OverallVerdict aggregate(const core::FieldDecision& category,
                               const core::FieldDecision& price,
                               const core::FieldDecision& age_verification) noexcept {
  switch (worst_level(category.level, price.level, age_verification.level)) {
    case core::DecisionLevel::HardStop:
      return core::OverallVerdict::RequiresCorrection;
    case core::DecisionLevel::Warning:
      return core::OverallVerdict::WarningsPendingReview;
    case core::DecisionLevel::Pass:
      break;
  }
  return core::OverallVerdict::Ready;
}

}  // namespace shelfcheck::rules
