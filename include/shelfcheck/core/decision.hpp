#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shelfcheck::core {

/// Severity of a single field check; ordered pass < warning < hard_stop.
enum class DecisionLevel : std::uint8_t {
  Pass,
  Warning,
  HardStop,
};

/// Outcome of one field rule (category, price or age verification).
struct FieldDecision {
  DecisionLevel level{DecisionLevel::Pass};
  std::string message;
  std::optional<std::string> predicted;  // category name or "Yes"/"No"
  std::optional<double> confidence;      // [0, 1]; absent when nothing was inferred
};

/// Typical price derived from neighbours; all three set or none.
struct PriceBand {
  std::optional<double> median;
  std::optional<double> lower;
  std::optional<double> upper;
};

/// "pass", "warning" or "hard_stop".
[[nodiscard]] std::string_view to_string(DecisionLevel level) noexcept;

/// Inverse of to_string(DecisionLevel); unknown text yields std::nullopt.
[[nodiscard]] std::optional<DecisionLevel> parse_decision_level(std::string_view text) noexcept;

}  // namespace shelfcheck::core
