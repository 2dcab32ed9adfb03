#include <shelfcheck/rules/field_inference.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace shelfcheck::rules {

CategoryInference infer_category(const core::NeighbourSet& neighbours) {
  // Insertion-ordered groups keep the tiebreak deterministic.
  std::vector<std::pair<std::string, double>> groups;
  double total = 0.0;
  for (const auto& n : neighbours) {
    auto it = std::find_if(groups.begin(), groups.end(),
                           [&n](const auto& g) { return g.first == n.entry.category; });
    if (it == groups.end()) {
      groups.emplace_back(n.entry.category, n.similarity);
    } else {
      it->second += n.similarity;
    }
    total += n.similarity;
  }
  if (groups.empty() || total <= 0.0) return {};

  const auto best = std::max_element(groups.begin(), groups.end(),
                                     [](const auto& a, const auto& b) { return a.second < b.second; });
  CategoryInference out;
  out.predicted = best->first;
  out.confidence = std::clamp(best->second / total, 0.0, 1.0);
  return out;
}

core::PriceBand infer_price_band(const core::NeighbourSet& neighbours) {
  std::vector<double> prices;
  prices.reserve(neighbours.size());
  for (const auto& n : neighbours) {
    if (n.entry.price.has_value() && std::isfinite(*n.entry.price)) {
      prices.push_back(*n.entry.price);
    }
  }
  if (prices.empty()) return {};

  std::sort(prices.begin(), prices.end());
  const std::size_t mid = prices.size() / 2;
  const double median =
      prices.size() % 2 == 1 ? prices[mid] : (prices[mid - 1] + prices[mid]) / 2.0;

  core::PriceBand band;
  band.median = median;
  band.lower = median * (1.0 - kPriceBandFraction);
  band.upper = median * (1.0 + kPriceBandFraction);
  return band;
}

AgeFlagInference infer_age_flag(const core::NeighbourSet& neighbours) {
  std::size_t known = 0;
  std::size_t yes = 0;
  double total = 0.0;
  for (const auto& n : neighbours) {
    total += n.similarity;
    if (!n.entry.age_verification_required.has_value()) continue;
    ++known;
    if (*n.entry.age_verification_required) ++yes;
  }
  // A set with no textual match carries no evidence about the flag.
  if (known == 0 || total <= 0.0) return {};

  const double yes_ratio = static_cast<double>(yes) / static_cast<double>(known);
  AgeFlagInference out;
  out.predicted = yes_ratio >= 0.5 ? "Yes" : "No";
  out.confidence = std::abs(yes_ratio - 0.5) * 2.0;
  return out;
}

}  // namespace shelfcheck::rules
