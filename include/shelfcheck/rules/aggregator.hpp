#pragma once

#include <shelfcheck/core/decision.hpp>
#include <shelfcheck/core/validation_result.hpp>

namespace shelfcheck::rules {

/// Worst of the three field levels (hard_stop > warning > pass).
[[nodiscard]] constexpr core::DecisionLevel worst_level(core::DecisionLevel a,
                                                        core::DecisionLevel b,
                                                        core::DecisionLevel c) noexcept {
  core::DecisionLevel worst = a;
  if (b > worst) worst = b;
  if (c > worst) worst = c;
  return worst;
}

/// Overall verdict: any hard_stop -> RequiresCorrection; else any warning ->
/// WarningsPendingReview; else Ready.
[[nodiscard]] core::OverallVerdict aggregate(const core::FieldDecision& category,
                                             const core::FieldDecision& price,
                                             const core::FieldDecision& age_verification) noexcept;

}  // namespace shelfcheck::rules
