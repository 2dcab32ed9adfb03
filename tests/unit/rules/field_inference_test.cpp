#include <shelfcheck/core/neighbour.hpp>
#include <shelfcheck/rules/field_inference.hpp>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <utility>

namespace sc = shelfcheck::core;
namespace sr = shelfcheck::rules;

namespace {

sc::Neighbour neighbour(std::string category,
                        std::optional<double> price,
                        std::optional<bool> age_flag,
                        double similarity) {
  sc::Neighbour n;
  n.entry.name = category + " item";
  n.entry.category = std::move(category);
  n.entry.price = price;
  n.entry.age_verification_required = age_flag;
  n.similarity = similarity;
  return n;
}

}  // namespace

TEST(InferCategory, HighestSummedSimilarityWins) {
  const sc::NeighbourSet set = {
      neighbour("Wine", 8.0, true, 0.6),
      neighbour("Beer & Cider", 5.0, true, 0.5),
      neighbour("Beer & Cider", 6.0, true, 0.3),
  };
  const auto inferred = sr::infer_category(set);
  ASSERT_TRUE(inferred.predicted.has_value());
  EXPECT_EQ(*inferred.predicted, "Beer & Cider");
  EXPECT_NEAR(inferred.confidence, 0.8 / 1.4, 1e-12);
}

TEST(InferCategory, TieGoesToFirstSeenCategory) {
  const sc::NeighbourSet set = {
      neighbour("Snacks", 1.0, false, 0.4),
      neighbour("Confectionery", 1.0, false, 0.4),
  };
  const auto inferred = sr::infer_category(set);
  ASSERT_TRUE(inferred.predicted.has_value());
  EXPECT_EQ(*inferred.predicted, "Snacks");
  EXPECT_DOUBLE_EQ(inferred.confidence, 0.5);
}

TEST(InferCategory, EmptyOrZeroSimilarityGivesNoPrediction) {
  EXPECT_FALSE(sr::infer_category({}).predicted.has_value());
  EXPECT_DOUBLE_EQ(sr::infer_category({}).confidence, 0.0);
  const sc::NeighbourSet zeros = {neighbour("Snacks", 1.0, false, 0.0),
                                  neighbour("Dairy", 1.0, false, 0.0)};
  const auto inferred = sr::infer_category(zeros);
  EXPECT_FALSE(inferred.predicted.has_value());
  EXPECT_DOUBLE_EQ(inferred.confidence, 0.0);
}

TEST(InferPriceBand, OddCountMedian) {
  const sc::NeighbourSet set = {neighbour("A", 6.0, std::nullopt, 0.9),
                                neighbour("A", 2.0, std::nullopt, 0.5),
                                neighbour("A", 4.0, std::nullopt, 0.1)};
  const auto band = sr::infer_price_band(set);
  ASSERT_TRUE(band.median.has_value());
  EXPECT_DOUBLE_EQ(*band.median, 4.0);
  EXPECT_DOUBLE_EQ(*band.lower, 3.0);
  EXPECT_DOUBLE_EQ(*band.upper, 5.0);
}

TEST(InferPriceBand, EvenCountAveragesMiddlePair) {
  const sc::NeighbourSet set = {neighbour("A", 8.0, std::nullopt, 0.9),
                                neighbour("A", 2.0, std::nullopt, 0.5),
                                neighbour("A", std::nullopt, std::nullopt, 0.5),
                                neighbour("A", 4.0, std::nullopt, 0.1),
                                neighbour("A", 6.0, std::nullopt, 0.1)};
  const auto band = sr::infer_price_band(set);
  ASSERT_TRUE(band.median.has_value());
  EXPECT_DOUBLE_EQ(*band.median, 5.0);
}

TEST(InferPriceBand, ZeroSimilarityNeighboursStillCount) {
  const sc::NeighbourSet set = {neighbour("A", 10.0, std::nullopt, 0.0)};
  const auto band = sr::infer_price_band(set);
  ASSERT_TRUE(band.median.has_value());
  EXPECT_DOUBLE_EQ(*band.median, 10.0);
}

TEST(InferPriceBand, NoPricesGivesEmptyBand) {
  const sc::NeighbourSet set = {neighbour("A", std::nullopt, true, 0.7)};
  const auto band = sr::infer_price_band(set);
  EXPECT_FALSE(band.median.has_value());
  EXPECT_FALSE(band.lower.has_value());
  EXPECT_FALSE(band.upper.has_value());
  EXPECT_FALSE(sr::infer_price_band({}).median.has_value());
}

TEST(InferAgeFlag, MajorityWithScaledConfidence) {
  const sc::NeighbourSet set = {neighbour("A", 1.0, true, 0.9), neighbour("A", 1.0, true, 0.8),
                                neighbour("A", 1.0, true, 0.7), neighbour("A", 1.0, false, 0.6),
                                neighbour("A", 1.0, std::nullopt, 0.5)};
  const auto inferred = sr::infer_age_flag(set);
  ASSERT_TRUE(inferred.predicted.has_value());
  EXPECT_EQ(*inferred.predicted, "Yes");
  EXPECT_DOUBLE_EQ(inferred.confidence, 0.5);
}

TEST(InferAgeFlag, EvenSplitPredictsYesWithZeroConfidence) {
  const sc::NeighbourSet set = {neighbour("A", 1.0, true, 0.9), neighbour("A", 1.0, false, 0.8)};
  const auto inferred = sr::infer_age_flag(set);
  ASSERT_TRUE(inferred.predicted.has_value());
  EXPECT_EQ(*inferred.predicted, "Yes");
  EXPECT_DOUBLE_EQ(inferred.confidence, 0.0);
}

TEST(InferAgeFlag, UnanimousNo) {
  const sc::NeighbourSet set = {neighbour("A", 1.0, false, 0.9), neighbour("A", 1.0, false, 0.2)};
  const auto inferred = sr::infer_age_flag(set);
  ASSERT_TRUE(inferred.predicted.has_value());
  EXPECT_EQ(*inferred.predicted, "No");
  EXPECT_DOUBLE_EQ(inferred.confidence, 1.0);
}

TEST(InferAgeFlag, UnknownFlagsGiveNoPrediction) {
  const sc::NeighbourSet set = {neighbour("A", 1.0, std::nullopt, 0.9),
                                neighbour("A", 1.0, std::nullopt, 0.4)};
  const auto inferred = sr::infer_age_flag(set);
  EXPECT_FALSE(inferred.predicted.has_value());
  EXPECT_DOUBLE_EQ(inferred.confidence, 0.0);
  EXPECT_FALSE(sr::infer_age_flag({}).predicted.has_value());
}

TEST(InferAgeFlag, AllZeroSimilarityGivesNoPrediction) {
  const sc::NeighbourSet set = {neighbour("A", 1.0, true, 0.0), neighbour("A", 1.0, true, 0.0)};
  const auto inferred = sr::infer_age_flag(set);
  EXPECT_FALSE(inferred.predicted.has_value());
  EXPECT_DOUBLE_EQ(inferred.confidence, 0.0);
}

TEST(InferAgeFlag, ZeroSimilarityNeighboursVoteInPartialMatch) {
  // One real match plus two unrelated rows: yes_ratio is 2/3.
  const sc::NeighbourSet set = {neighbour("Soft Drinks", 1.0, false, 0.447),
                                neighbour("Wine", 7.0, true, 0.0),
                                neighbour("Wine", 8.0, true, 0.0)};
  const auto inferred = sr::infer_age_flag(set);
  ASSERT_TRUE(inferred.predicted.has_value());
  EXPECT_EQ(*inferred.predicted, "Yes");
  EXPECT_NEAR(inferred.confidence, 1.0 / 3.0, 1e-12);
}
