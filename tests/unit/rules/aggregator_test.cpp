#include <shelfcheck/core/decision.hpp>
#include <shelfcheck/core/validation_result.hpp>
#include <shelfcheck/rules/aggregator.hpp>
#include <gtest/gtest.h>
#include <array>

namespace sc = shelfcheck::core;
namespace sr = shelfcheck::rules;

namespace {

constexpr std::array<sc::DecisionLevel, 3> kLevels = {
    sc::DecisionLevel::Pass, sc::DecisionLevel::Warning, sc::DecisionLevel::HardStop};

sc::FieldDecision at(sc::DecisionLevel level) {
  sc::FieldDecision d;
  d.level = level;
  return d;
}

}  // namespace

TEST(Aggregator, WorstLevelWins) {
  static_assert(sr::worst_level(sc::DecisionLevel::Pass, sc::DecisionLevel::HardStop,
                                sc::DecisionLevel::Warning) == sc::DecisionLevel::HardStop);
  EXPECT_EQ(sr::aggregate(at(sc::DecisionLevel::Pass), at(sc::DecisionLevel::Pass),
                          at(sc::DecisionLevel::Pass)),
            sc::OverallVerdict::Ready);
}

TEST(Aggregator, AllCombinationsAreMonotone) {
  int combinations = 0;
  for (auto a : kLevels) {
    for (auto b : kLevels) {
      for (auto c : kLevels) {
        ++combinations;
        const bool any_hard_stop = a == sc::DecisionLevel::HardStop ||
                                   b == sc::DecisionLevel::HardStop ||
                                   c == sc::DecisionLevel::HardStop;
        const bool any_warning = a == sc::DecisionLevel::Warning ||
                                 b == sc::DecisionLevel::Warning ||
                                 c == sc::DecisionLevel::Warning;
        sc::OverallVerdict expected = sc::OverallVerdict::Ready;
        if (any_hard_stop) {
          expected = sc::OverallVerdict::RequiresCorrection;
        } else if (any_warning) {
          expected = sc::OverallVerdict::WarningsPendingReview;
        }
        EXPECT_EQ(sr::aggregate(at(a), at(b), at(c)), expected)
            << sc::to_string(a) << "/" << sc::to_string(b) << "/" << sc::to_string(c);
      }
    }
  }
  EXPECT_EQ(combinations, 27);
}
