#pragma once

#include <shelfcheck/app/submission.hpp>
#include <shelfcheck/core/validation_result.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace shelfcheck::app {

enum class RiskLevel : std::uint8_t {
  Low,
  Medium,
  High,
};

/// Sum over the three fields of hard_stop = 2, warning = 1, pass = 0.
[[nodiscard]] int risk_score(const core::ValidationResult& result) noexcept;

/// High for score >= 3, Medium for >= 1, else Low.
[[nodiscard]] RiskLevel risk_level(int score) noexcept;

[[nodiscard]] std::string_view to_string(RiskLevel level) noexcept;

struct ReviewItem {
  Submission submission;
  int score{0};
  RiskLevel level{RiskLevel::Low};
};

/// Submissions ordered for head-office review: highest risk first, then newest.
[[nodiscard]] std::vector<ReviewItem> prepare_review_queue(std::vector<Submission> submissions);

struct QueueSummary {
  std::size_t pending{0};
  std::size_t approved{0};
  std::size_t denied{0};
};

[[nodiscard]] QueueSummary summarize(const std::vector<Submission>& submissions) noexcept;

}  // namespace shelfcheck::app
