#include <shelfcheck/app/review_queue.hpp>
#include <shelfcheck/app/submission.hpp>
#include <shelfcheck/core/decision.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sa = shelfcheck::app;
namespace sc = shelfcheck::core;

namespace {

sa::Submission make(std::uint64_t id,
                    std::string timestamp,
                    sc::DecisionLevel category,
                    sc::DecisionLevel price,
                    sc::DecisionLevel age,
                    sa::SubmissionStatus status = sa::SubmissionStatus::Pending) {
  sa::Submission s;
  s.id = id;
  s.timestamp = std::move(timestamp);
  s.result.category.level = category;
  s.result.price.level = price;
  s.result.age_verification.level = age;
  s.status = status;
  return s;
}

}  // namespace

TEST(ReviewQueue, RiskScoreAndLevel) {
  sc::ValidationResult r;
  EXPECT_EQ(sa::risk_score(r), 0);
  r.price.level = sc::DecisionLevel::HardStop;
  r.category.level = sc::DecisionLevel::Warning;
  EXPECT_EQ(sa::risk_score(r), 3);
  EXPECT_EQ(sa::risk_level(0), sa::RiskLevel::Low);
  EXPECT_EQ(sa::risk_level(1), sa::RiskLevel::Medium);
  EXPECT_EQ(sa::risk_level(2), sa::RiskLevel::Medium);
  EXPECT_EQ(sa::risk_level(3), sa::RiskLevel::High);
  EXPECT_EQ(sa::risk_level(6), sa::RiskLevel::High);
  EXPECT_EQ(sa::to_string(sa::RiskLevel::High), "High");
}

TEST(ReviewQueue, OrdersByRiskThenNewest) {
  using L = sc::DecisionLevel;
  std::vector<sa::Submission> pending = {
      make(1, "2026-01-01T09:00:00.000Z", L::Warning, L::Pass, L::Pass),
      make(2, "2026-01-01T10:00:00.000Z", L::Pass, L::HardStop, L::Warning),
      make(3, "2026-01-01T11:00:00.000Z", L::Warning, L::Pass, L::Pass),
      make(4, "2026-01-01T08:00:00.000Z", L::Pass, L::HardStop, L::HardStop),
  };
  const auto queue = sa::prepare_review_queue(pending);
  ASSERT_EQ(queue.size(), 4u);
  EXPECT_EQ(queue[0].submission.id, 4u);
  EXPECT_EQ(queue[0].score, 4);
  EXPECT_EQ(queue[0].level, sa::RiskLevel::High);
  EXPECT_EQ(queue[1].submission.id, 2u);
  EXPECT_EQ(queue[2].submission.id, 3u);
  EXPECT_EQ(queue[3].submission.id, 1u);
  EXPECT_EQ(queue[3].level, sa::RiskLevel::Medium);
}

TEST(ReviewQueue, SummaryCountsEachStatus) {
  using L = sc::DecisionLevel;
  const std::vector<sa::Submission> all = {
      make(1, "t1", L::Pass, L::Pass, L::Pass, sa::SubmissionStatus::Approved),
      make(2, "t2", L::Warning, L::Pass, L::Pass, sa::SubmissionStatus::Pending),
      make(3, "t3", L::HardStop, L::Pass, L::Pass, sa::SubmissionStatus::Denied),
      make(4, "t4", L::Pass, L::Pass, L::Pass, sa::SubmissionStatus::Approved),
  };
  const sa::QueueSummary summary = sa::summarize(all);
  EXPECT_EQ(summary.pending, 1u);
  EXPECT_EQ(summary.approved, 2u);
  EXPECT_EQ(summary.denied, 1u);
  EXPECT_TRUE(sa::prepare_review_queue({}).empty());
}
