#include <shelfcheck/app/validation_runner.hpp>
#include <shelfcheck/core/catalog_entry.hpp>
#include <shelfcheck/core/error.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <shelfcheck/engine/product_validator.hpp>
#include <shelfcheck/similarity/catalog_index.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sa = shelfcheck::app;
namespace sc = shelfcheck::core;
namespace se = shelfcheck::engine;
namespace ss = shelfcheck::similarity;

namespace {

sc::CatalogEntry entry(std::string name, std::string category, double price, bool age) {
  sc::CatalogEntry e;
  e.name = std::move(name);
  e.category = std::move(category);
  e.price = price;
  e.age_verification_required = age;
  return e;
}

se::ProductValidator make_validator() {
  auto index = ss::CatalogIndex::build({
      entry("Premium Lager 4x440ml", "Beer & Cider", 5.50, true),
      entry("Cola 2L", "Soft Drinks", 2.00, false),
      entry("Diet Cola 2L", "Soft Drinks", 2.00, false),
      entry("Salted Crisps 150g", "Snacks", 1.60, false),
  });
  EXPECT_TRUE(index.has_value());
  return se::ProductValidator(*index);
}

std::vector<sc::ProductSubmission> make_batch(std::size_t n) {
  std::vector<sc::ProductSubmission> batch;
  for (std::size_t i = 0; i < n; ++i) {
    sc::ProductSubmission s;
    s.name = i % 2 == 0 ? "Cola 2L" : "Premium Lager";
    s.category = "Soft Drinks";
    s.price = 1.0 + static_cast<double>(i);
    s.age_flag = "No";
    batch.push_back(std::move(s));
  }
  return batch;
}

}  // namespace

TEST(ValidationRunner, SingleRunDelegatesToValidator) {
  const se::ProductValidator validator = make_validator();
  sc::ProductSubmission s;
  s.name = "Cola 2L";
  s.category = "Soft Drinks";
  s.price = 2.0;
  s.age_flag = "No";
  auto outcome = sa::run_validation(validator, s);
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->overall, sc::OverallVerdict::Ready);
}

TEST(ValidationRunner, SequentialBatchVisitsInOrder) {
  const se::ProductValidator validator = make_validator();
  const auto batch = make_batch(5);
  std::vector<std::size_t> seen;
  sa::run_validation_batch(validator, batch, [&seen](std::size_t i, const sa::ValidationOutcome& o) {
    EXPECT_TRUE(o.has_value());
    seen.push_back(i);
  });
  const std::vector<std::size_t> expected = {0, 1, 2, 3, 4};
  EXPECT_EQ(seen, expected);
}

TEST(ValidationRunner, ParallelBatchVisitsEveryIndexOnce) {
  const se::ProductValidator validator = make_validator();
  const auto batch = make_batch(40);
  std::mutex mutex;
  std::multiset<std::size_t> seen;
  sa::run_validation_batch_parallel(
      validator, batch,
      [&](std::size_t i, const sa::ValidationOutcome& o) {
        std::lock_guard lock(mutex);
        EXPECT_TRUE(o.has_value());
        seen.insert(i);
      },
      4);
  ASSERT_EQ(seen.size(), batch.size());
  for (std::size_t i = 0; i < batch.size(); ++i) EXPECT_EQ(seen.count(i), 1u);
}

TEST(ValidationRunner, ValidateAllMatchesSequentialResults) {
  const se::ProductValidator validator = make_validator();
  auto batch = make_batch(12);
  batch[5].price = std::numeric_limits<double>::quiet_NaN();
  const auto outcomes = sa::validate_all(validator, batch, 3);
  ASSERT_EQ(outcomes.size(), batch.size());
  for (std::size_t i = 0; i < batch.size(); ++i) {
    if (i == 5) {
      ASSERT_FALSE(outcomes[i].has_value());
      EXPECT_EQ(outcomes[i].error().kind, sc::ErrorKind::ValidationInputError);
      continue;
    }
    auto expected = validator.validate(batch[i]);
    ASSERT_TRUE(outcomes[i].has_value());
    EXPECT_EQ(outcomes[i]->overall, expected->overall);
    EXPECT_EQ(outcomes[i]->price.level, expected->price.level);
    EXPECT_EQ(outcomes[i]->age_verification.level, expected->age_verification.level);
  }
}

TEST(ValidationRunner, EmptyBatchAndMissingCallbackAreNoOps) {
  const se::ProductValidator validator = make_validator();
  int calls = 0;
  sa::run_validation_batch_parallel(validator, {}, [&calls](std::size_t, const sa::ValidationOutcome&) {
    ++calls;
  });
  EXPECT_EQ(calls, 0);
  sa::run_validation_batch_parallel(validator, make_batch(3), nullptr, 2);
  EXPECT_TRUE(sa::validate_all(validator, {}).empty());
}
