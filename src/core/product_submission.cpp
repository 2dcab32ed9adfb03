#include <shelfcheck/core/product_submission.hpp>
#include <charconv>
#include <cmath>
#include <utility>

namespace shelfcheck::core {

namespace {

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

}  // namespace

std::expected<ProductSubmission, Error> parse_submission(
    std::string name,
    std::string category,
    std::string_view price_text,
    std::string age_flag) {
  const std::string_view text = trim(price_text);
  if (text.empty()) {
    return std::unexpected(Error{ErrorKind::ValidationInputError, "price is required"});
  }

  double price = 0.0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  // from_chars rejects a leading '+', which form input may carry.
  if (*first == '+') ++first;
  const auto [ptr, ec] = std::from_chars(first, last, price);
  if (ec != std::errc{} || ptr != last || !std::isfinite(price)) {
    return std::unexpected(Error{ErrorKind::ValidationInputError,
                                 "price is not a number: '" + std::string(text) + "'"});
  }

  ProductSubmission s;
  s.name = std::move(name);
  s.category = std::move(category);
  s.price = price;
  s.age_flag = std::move(age_flag);
  return s;
}

}  // namespace shelfcheck::core
