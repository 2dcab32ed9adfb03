#pragma once

#include <shelfcheck/core/decision.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace shelfcheck::rules {

/// Confidence at which a mismatch is reported as a strong suggestion.
inline constexpr double kStrongConfidence = 0.70;
/// |price - median| / median up to which a price passes.
inline constexpr double kPricePassFraction = 0.25;
/// |price - median| / median up to which a price is only a warning.
inline constexpr double kPriceWarningFraction = 0.50;

/// Name keywords (lowercase substrings) that make a product age-restricted by policy.
inline constexpr std::array<std::string_view, 11> kAlcoholKeywords = {
    "beer", "lager", "cider", "wine", "vodka", "rum",
    "gin", "whisky", "whiskey", "brandy", "alcopop",
};

/// Category substring (lowercase) that makes a product age-restricted by policy.
inline constexpr std::string_view kAlcoholCategoryKeyword = "alcohol";

/// Trimmed, title-cased flag ("yes " -> "Yes", "NO" -> "No").
[[nodiscard]] std::string normalize_flag(std::string_view flag);

/// True when the name or category matches the fixed age-restriction policy lists.
[[nodiscard]] bool requires_age_verification_by_policy(std::string_view product_name,
                                                       std::string_view category);

/// Category check. Never hard_stop: a mismatch is a warning at any confidence;
/// confidence only changes the wording.
[[nodiscard]] core::FieldDecision classify_category(std::string_view submitted,
                                                    const std::optional<std::string>& predicted,
                                                    double confidence);

/// Price check against the neighbour band.
///   no median -> pass; price <= 0 -> hard_stop;
///   |diff| <= 25% -> pass; |diff| <= 50% -> warning; otherwise hard_stop.
[[nodiscard]] core::FieldDecision classify_price(double price, const core::PriceBand& band);

/// Age-verification check. The policy override (alcohol keyword or category with a
/// submitted "No") is a hard_stop and takes precedence over any inferred value.
[[nodiscard]] core::FieldDecision classify_age_flag(std::string_view product_name,
                                                    std::string_view category,
                                                    std::string_view submitted_flag,
                                                    const std::optional<std::string>& predicted_flag,
                                                    double confidence);

}  // namespace shelfcheck::rules
