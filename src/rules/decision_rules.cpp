#include <shelfcheck/rules/decision_rules.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace shelfcheck::rules {

namespace {

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
  });
  return out;
}

std::string percent(double fraction) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(0) << fraction * 100.0 << '%';
  return os.str();
}

std::string pounds(double value) {
  std::ostringstream os;
  os << "\xC2\xA3" << std::fixed << std::setprecision(2) << value;
  return os.str();
}

core::FieldDecision make(core::DecisionLevel level, std::string message) {
  core::FieldDecision d;
  d.level = level;
  d.message = std::move(message);
  return d;
}

}  // namespace

std::string normalize_flag(std::string_view flag) {
  const auto start = flag.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = flag.find_last_not_of(" \t\r\n");
  std::string out = to_lower(flag.substr(start, end - start + 1));

  bool word_start = true;
  for (char& c : out) {
    const auto u = static_cast<unsigned char>(c);
    const bool alpha = (u >= 'a' && u <= 'z');
    if (alpha && word_start) c = static_cast<char>(u - 'a' + 'A');
    word_start = !alpha;
  }
  return out;
}

bool requires_age_verification_by_policy(std::string_view product_name, std::string_view category) {
  if (to_lower(category).find(kAlcoholCategoryKeyword) != std::string::npos) return true;
  const std::string name = to_lower(product_name);
  return std::any_of(kAlcoholKeywords.begin(), kAlcoholKeywords.end(),
                     [&name](std::string_view w) { return name.find(w) != std::string::npos; });
}

core::FieldDecision classify_category(std::string_view submitted,
                                      const std::optional<std::string>& predicted,
                                      double confidence) {
  if (!predicted.has_value() || predicted->empty()) {
    return make(core::DecisionLevel::Pass, "No clear match found in HO data, category accepted.");
  }

  core::FieldDecision d;
  d.predicted = predicted;
  d.confidence = confidence;

  if (submitted == *predicted) {
    d.level = core::DecisionLevel::Pass;
    d.message = "Category matches typical HO category '" + *predicted + "'.";
    return d;
  }

  d.level = core::DecisionLevel::Warning;
  if (confidence >= kStrongConfidence) {
    d.message = "Most similar HO products are in category '" + *predicted + "' (confidence " +
                percent(confidence) + "). Consider updating.";
  } else {
    d.message = "Category differs from common HO category '" + *predicted +
                "', but model confidence is moderate. Submission will be flagged for review.";
  }
  return d;
}

core::FieldDecision classify_price(double price, const core::PriceBand& band) {
  if (!band.median.has_value()) {
    return make(core::DecisionLevel::Pass, "No price band available; price accepted.");
  }
  if (price <= 0.0) {
    return make(core::DecisionLevel::HardStop, "Price must be greater than zero.");
  }

  const double median = *band.median;
  const double diff = median > 0.0 ? (price - median) / median : 0.0;
  const double magnitude = std::abs(diff);

  if (magnitude <= kPricePassFraction) {
    return make(core::DecisionLevel::Pass,
                "Price is within \xC2\xB1" "25% of typical HO price (~" + pounds(median) + ").");
  }
  if (magnitude <= kPriceWarningFraction) {
    return make(core::DecisionLevel::Warning,
                "Price is " + percent(diff) + " away from typical HO price (~" + pounds(median) +
                    "). Submission will be flagged for review.");
  }
  return make(core::DecisionLevel::HardStop,
              "Price is an extreme outlier (" + percent(diff) + " from typical ~" + pounds(median) +
                  "). Please check and correct before submitting.");
}

core::FieldDecision classify_age_flag(std::string_view product_name,
                                      std::string_view category,
                                      std::string_view submitted_flag,
                                      const std::optional<std::string>& predicted_flag,
                                      double confidence) {
  const std::string submitted = normalize_flag(submitted_flag);
  std::optional<std::string> predicted;
  if (predicted_flag.has_value()) {
    std::string p = normalize_flag(*predicted_flag);
    if (!p.empty()) predicted = std::move(p);
  }

  core::FieldDecision d;
  if (predicted.has_value()) {
    d.predicted = predicted;
    d.confidence = confidence;
  }

  if (submitted == "No" && requires_age_verification_by_policy(product_name, category)) {
    d.level = core::DecisionLevel::HardStop;
    d.message =
        "Product appears to be age-restricted by policy. Age verification must be set to 'Yes'.";
    return d;
  }

  if (!predicted.has_value()) {
    d.level = core::DecisionLevel::Pass;
    d.message = "No clear age-check pattern in HO data; value accepted.";
    return d;
  }

  if (submitted == *predicted) {
    d.level = core::DecisionLevel::Pass;
    d.message = "Age verification setting matches typical HO pattern ('" + *predicted + "').";
    return d;
  }

  d.level = core::DecisionLevel::Warning;
  if (confidence >= kStrongConfidence) {
    d.message = "Most similar HO products use age verification '" + *predicted +
                "'. Submission will be flagged for review.";
  } else {
    d.message =
        "Age verification differs from many similar HO products; submission will be flagged "
        "for review.";
  }
  return d;
}

}  // namespace shelfcheck::rules
