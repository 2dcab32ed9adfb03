#include <shelfcheck/app/catalog_loader.hpp>
#include <shelfcheck/app/explainer.hpp>
#include <shelfcheck/app/json_submission_repository.hpp>
#include <shelfcheck/app/review_queue.hpp>
#include <shelfcheck/app/submission.hpp>
#include <shelfcheck/app/validation_runner.hpp>
#include <shelfcheck/core/decision.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <shelfcheck/engine/product_validator.hpp>
#include <shelfcheck/similarity/catalog_index.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#ifndef SHELFCHECK_SAMPLE_CATALOG
#define SHELFCHECK_SAMPLE_CATALOG "data/ho_products.csv"
#endif

namespace {

using namespace shelfcheck::app;
using namespace shelfcheck::core;
using namespace shelfcheck::engine;
using namespace shelfcheck::similarity;

std::shared_ptr<const CatalogIndex> load_sample_index() {
  auto loaded = load_catalog_csv(SHELFCHECK_SAMPLE_CATALOG);
  EXPECT_TRUE(loaded.has_value()) << (loaded ? "" : loaded.error().message);
  if (!loaded) return nullptr;
  EXPECT_TRUE(loaded->warnings.empty());
  auto index = CatalogIndex::build(std::move(loaded->catalog));
  EXPECT_TRUE(index.has_value());
  return index ? *index : nullptr;
}

ProductSubmission product(std::string name, std::string category, double price, std::string flag) {
  ProductSubmission s;
  s.name = std::move(name);
  s.category = std::move(category);
  s.price = price;
  s.age_flag = std::move(flag);
  return s;
}

}  // namespace

TEST(FullValidation, SampleCatalogLoads) {
  const auto index = load_sample_index();
  ASSERT_NE(index.get(), nullptr);
  EXPECT_EQ(index->size(), 55u);
  EXPECT_EQ(index->categories().front(), "Bakery");
}

TEST(FullValidation, MatchingColaIsReady) {
  const ProductValidator validator(load_sample_index(), ValidatorOptions{5});
  auto result = validator.validate(product("Cola 2L", "Soft Drinks", 2.00, "No"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->category.level, DecisionLevel::Pass);
  EXPECT_EQ(result->category.predicted, "Soft Drinks");
  ASSERT_TRUE(result->price_band.median.has_value());
  EXPECT_DOUBLE_EQ(*result->price_band.median, 2.00);
  EXPECT_EQ(result->price.level, DecisionLevel::Pass);
  EXPECT_EQ(result->age_verification.level, DecisionLevel::Pass);
  EXPECT_EQ(result->overall, OverallVerdict::Ready);
  EXPECT_EQ(result->neighbours.size(), 5u);
}

TEST(FullValidation, PriceBandAroundColaMedian) {
  const ProductValidator validator(load_sample_index(), ValidatorOptions{5});
  auto warning = validator.validate(product("Cola 2L", "Soft Drinks", 2.60, "No"));
  ASSERT_TRUE(warning.has_value());
  EXPECT_EQ(warning->price.level, DecisionLevel::Warning);
  EXPECT_EQ(warning->overall, OverallVerdict::WarningsPendingReview);

  auto outlier = validator.validate(product("Cola 2L", "Soft Drinks", 9.99, "No"));
  ASSERT_TRUE(outlier.has_value());
  EXPECT_EQ(outlier->price.level, DecisionLevel::HardStop);
  EXPECT_EQ(outlier->overall, OverallVerdict::RequiresCorrection);
}

TEST(FullValidation, WrongCategoryIsSuggested) {
  const ProductValidator validator(load_sample_index(), ValidatorOptions{5});
  auto result = validator.validate(product("Cola 2L", "Snacks", 2.00, "No"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->category.level, DecisionLevel::Warning);
  EXPECT_EQ(result->category.predicted, "Soft Drinks");
  EXPECT_EQ(result->overall, OverallVerdict::WarningsPendingReview);
}

TEST(FullValidation, LagerWithoutAgeCheckNeedsCorrection) {
  const ProductValidator validator(load_sample_index(), ValidatorOptions{5});
  auto result = validator.validate(product("Premium Lager 4x440ml", "Soft Drinks", 5.50, "No"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->age_verification.level, DecisionLevel::HardStop);
  EXPECT_EQ(result->category.level, DecisionLevel::Warning);
  EXPECT_EQ(result->category.predicted, "Beer & Cider");
  EXPECT_EQ(result->price.level, DecisionLevel::Pass);
  EXPECT_EQ(result->overall, OverallVerdict::RequiresCorrection);
  EXPECT_TRUE(requires_head_office_review(*result));
}

TEST(FullValidation, EnergyDrinkAgeMismatchIsFlagged) {
  const ProductValidator validator(load_sample_index(), ValidatorOptions{5});
  auto result = validator.validate(product("Energy Drink 330ml", "Soft Drinks", 1.50, "No"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->age_verification.level, DecisionLevel::Warning);
  EXPECT_EQ(result->age_verification.predicted, "Yes");
  EXPECT_EQ(result->overall, OverallVerdict::WarningsPendingReview);
}

TEST(FullValidation, UnknownProductWithDefaultNeighbourCount) {
  const ProductValidator validator(load_sample_index());
  auto result = validator.validate(product("Zzyzx Qwerty", "Garden", 2.00, "No"));
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->neighbours.size(), kDefaultTopK);
  for (const auto& n : result->neighbours) EXPECT_DOUBLE_EQ(n.similarity, 0.0);
  EXPECT_EQ(result->category.level, DecisionLevel::Pass);
  EXPECT_FALSE(result->category.predicted.has_value());
  EXPECT_EQ(result->age_verification.level, DecisionLevel::Pass);
  EXPECT_FALSE(result->age_verification.predicted.has_value());
  EXPECT_TRUE(result->price_band.median.has_value());
}

TEST(FullValidation, BatchMatchesSingleCalls) {
  const ProductValidator validator(load_sample_index(), ValidatorOptions{5});
  const std::vector<ProductSubmission> batch = {
      product("Cola 2L", "Soft Drinks", 2.00, "No"),
      product("Premium Lager 4x440ml", "Soft Drinks", 5.50, "No"),
      product("Energy Drink 330ml", "Soft Drinks", 1.50, "No"),
      product("Salted Crisps 150g", "Snacks", 1.60, "No"),
  };
  const auto outcomes = validate_all(validator, batch, 2);
  ASSERT_EQ(outcomes.size(), batch.size());
  for (std::size_t i = 0; i < batch.size(); ++i) {
    auto single = validator.validate(batch[i]);
    ASSERT_TRUE(outcomes[i].has_value());
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(outcomes[i]->overall, single->overall) << batch[i].name;
  }
}

TEST(FullValidation, SubmitReviewAndReload) {
  const ProductValidator validator(load_sample_index(), ValidatorOptions{5});
  const auto dir = std::filesystem::temp_directory_path() / "shelfcheck_full_validation";
  std::filesystem::remove_all(dir);
  const std::string path = (dir / "submissions.json").string();

  {
    auto repo = JsonSubmissionRepository::open(path);
    ASSERT_TRUE(repo.has_value());
    for (auto p : {product("Cola 2L", "Soft Drinks", 2.00, "No"),
                   product("Energy Drink 330ml", "Soft Drinks", 1.50, "No"),
                   product("Premium Lager 4x440ml", "Soft Drinks", 5.50, "No")}) {
      auto result = validator.validate(p);
      ASSERT_TRUE(result.has_value());
      auto explainer = make_explainer(shelfcheck::app::ExplainerType::Template);
      ASSERT_NE(explainer.get(), nullptr);
      auto text = explainer->explain(p, *result);
      ASSERT_TRUE(text.has_value());
      EXPECT_NE(text->find(result->age_verification.message), std::string::npos);
      ASSERT_TRUE((*repo)->append(NewSubmission{p, *result, {}, std::nullopt}));
    }

    const auto pending = (*repo)->list_by_status(SubmissionStatus::Pending);
    ASSERT_EQ(pending.size(), 2u);
    const auto queue = prepare_review_queue(pending);
    ASSERT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue[0].submission.product.name, "Premium Lager 4x440ml");
    EXPECT_EQ(queue[0].level, RiskLevel::High);
    EXPECT_EQ(queue[1].submission.product.name, "Energy Drink 330ml");

    ASSERT_TRUE((*repo)->deny(queue[0].submission.id, std::string("Age check must be Yes")));
    ASSERT_TRUE((*repo)->approve(queue[1].submission.id));
  }

  auto reopened = JsonSubmissionRepository::open(path);
  ASSERT_TRUE(reopened.has_value());
  const QueueSummary summary = summarize((*reopened)->list_all());
  EXPECT_EQ(summary.pending, 0u);
  EXPECT_EQ(summary.approved, 2u);
  EXPECT_EQ(summary.denied, 1u);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}
