#pragma once

#include <shelfcheck/core/decision.hpp>
#include <shelfcheck/core/neighbour.hpp>
#include <optional>
#include <string>

namespace shelfcheck::rules {

/// Half-width of the typical price band around the neighbour median.
inline constexpr double kPriceBandFraction = 0.25;

/// Predicted value plus its strength in [0, 1]; strength is 0 when nothing was predicted.
struct CategoryInference {
  std::optional<std::string> predicted;
  double confidence{0.0};
};

struct AgeFlagInference {
  std::optional<std::string> predicted;  // "Yes" or "No"
  double confidence{0.0};
};

/// Category whose neighbours carry the largest summed similarity (first seen wins ties).
/// Confidence is that group's share of the total similarity.
/// No prediction when the set is empty or every similarity is 0.
[[nodiscard]] CategoryInference infer_category(const core::NeighbourSet& neighbours);

/// Median of neighbour prices (missing prices ignored) with a +/-25% band.
/// Every neighbour counts, including those at similarity 0.
[[nodiscard]] core::PriceBand infer_price_band(const core::NeighbourSet& neighbours);

/// Majority age-verification setting among neighbours with a known flag.
/// Confidence is |yes_ratio - 0.5| * 2: 0 at an even split, 1 when unanimous.
/// No prediction when the set's total similarity is 0.
[[nodiscard]] AgeFlagInference infer_age_flag(const core::NeighbourSet& neighbours);

}  // namespace shelfcheck::rules
