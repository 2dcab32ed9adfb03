#pragma once

#include <shelfcheck/core/decision.hpp>
#include <shelfcheck/core/neighbour.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shelfcheck::core {

/// Overall verdict: the worst field decision mapped to a submission status.
enum class OverallVerdict : std::uint8_t {
  Ready,
  WarningsPendingReview,
  RequiresCorrection,
};

/// Result of validating one product listing. Neighbours are carried for display only.
struct ValidationResult {
  FieldDecision category;
  FieldDecision price;
  FieldDecision age_verification;
  PriceBand price_band;
  OverallVerdict overall{OverallVerdict::Ready};
  NeighbourSet neighbours;
};

/// Human status line, e.g. "Ready for automatic approval.".
[[nodiscard]] std::string_view overall_label(OverallVerdict verdict) noexcept;

/// Machine key: "ready", "warnings_pending_review" or "requires_correction".
[[nodiscard]] std::string_view to_string(OverallVerdict verdict) noexcept;

[[nodiscard]] std::optional<OverallVerdict> parse_overall_verdict(std::string_view text) noexcept;

}  // namespace shelfcheck::core
