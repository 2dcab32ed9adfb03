#include <shelfcheck/engine/product_validator.hpp>
#include <shelfcheck/rules/aggregator.hpp>
#include <shelfcheck/rules/decision_rules.hpp>
#include <shelfcheck/rules/field_inference.hpp>
#include <chrono>
#include <cmath>
#include <string>
#include <utility>

namespace shelfcheck::engine {

namespace {

class PhaseTimer {
 public:
  explicit PhaseTimer(PhaseTimingCallback* cb) : cb_(cb), start_(std::chrono::steady_clock::now()) {}

  void lap(Phase phase) {
    if (!cb_) return;
    const auto now = std::chrono::steady_clock::now();
    const double ms = 1e-6 * static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now - start_).count());
    (*cb_)(phase, ms);
    start_ = now;
  }

 private:
  PhaseTimingCallback* cb_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace

ProductValidator::ProductValidator(std::shared_ptr<const similarity::CatalogIndex> index,
                                   ValidatorOptions options)
    : index_(std::move(index)), options_(options) {}

void ProductValidator::replace_index(std::shared_ptr<const similarity::CatalogIndex> index) {
  index_.store(std::move(index));
}

std::expected<core::ValidationResult, core::Error> ProductValidator::validate(
    const core::ProductSubmission& submission,
    PhaseTimingCallback* timing_cb) const {
  const std::shared_ptr<const similarity::CatalogIndex> index = index_.load();
  if (!index) {
    return std::unexpected(
        core::Error{core::ErrorKind::DataError, "reference catalog is not loaded"});
  }
  if (!std::isfinite(submission.price)) {
    return std::unexpected(
        core::Error{core::ErrorKind::ValidationInputError, "price must be a finite number"});
  }

  PhaseTimer timer(timing_cb);
  core::ValidationResult result;

  result.neighbours = similarity::retrieve(*index, submission.name, options_.top_k);
  timer.lap(Phase::Retrieve);

  const rules::CategoryInference category = rules::infer_category(result.neighbours);
  result.price_band = rules::infer_price_band(result.neighbours);
  const rules::AgeFlagInference age = rules::infer_age_flag(result.neighbours);
  timer.lap(Phase::Infer);

  result.category =
      rules::classify_category(submission.category, category.predicted, category.confidence);
  result.price = rules::classify_price(submission.price, result.price_band);
  result.age_verification = rules::classify_age_flag(
      submission.name, submission.category, submission.age_flag, age.predicted, age.confidence);
  timer.lap(Phase::Classify);

  result.overall = rules::aggregate(result.category, result.price, result.age_verification);
  timer.lap(Phase::Aggregate);
  return result;
}

std::expected<core::ValidationResult, core::Error> ProductValidator::validate_product(
    std::string_view product_name,
    std::string_view category,
    double price,
    std::string_view age_flag) const {
  core::ProductSubmission s;
  s.name = std::string(product_name);
  s.category = std::string(category);
  s.price = price;
  s.age_flag = std::string(age_flag);
  return validate(s);
}

}  // namespace shelfcheck::engine
