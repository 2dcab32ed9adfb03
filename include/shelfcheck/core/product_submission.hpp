#pragma once

#include <shelfcheck/core/error.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace shelfcheck::core {

/// Product listing as submitted by a store.
struct ProductSubmission {
  std::string name;
  std::string category;
  double price{0.0};
  std::string age_flag;  // "Yes" / "No" as typed; normalised by the age rule
};

/// Build a submission from raw form text.
/// Fails with ValidationInputError when price_text is not a finite number.
/// Empty name, category or flag are accepted; the rules treat them as no match.
[[nodiscard]] std::expected<ProductSubmission, Error> parse_submission(
    std::string name,
    std::string category,
    std::string_view price_text,
    std::string age_flag);

}  // namespace shelfcheck::core
