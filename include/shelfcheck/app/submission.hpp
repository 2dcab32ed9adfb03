#pragma once

#include <shelfcheck/core/decision.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <shelfcheck/core/validation_result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shelfcheck::app {

/// Head-office review state of a stored submission.
enum class SubmissionStatus : std::uint8_t {
  Pending,
  Approved,
  Denied,
};

/// Submission as handed to a repository; id, timestamp and status are assigned there.
struct NewSubmission {
  core::ProductSubmission product;
  core::ValidationResult result;
  std::vector<std::string> accepted_changes;  // suggestions the store took, e.g. "category"
  std::optional<std::string> notes;
};

/// Stored submission. The validation result is kept without its neighbour list.
struct Submission {
  std::uint64_t id{0};
  std::string timestamp;  // UTC, ISO 8601
  core::ProductSubmission product;
  core::ValidationResult result;
  std::vector<std::string> accepted_changes;
  std::optional<std::string> notes;
  SubmissionStatus status{SubmissionStatus::Pending};
  bool flagged{false};
  std::optional<std::string> denial_reason;
};

[[nodiscard]] std::string_view to_string(SubmissionStatus status) noexcept;
[[nodiscard]] std::optional<SubmissionStatus> parse_submission_status(std::string_view text) noexcept;

/// A warning that needs a human: the rule was not confident (confidence < 0.70).
/// Warnings without a confidence (price) do not count.
[[nodiscard]] bool is_review_warning(const core::FieldDecision& decision) noexcept;

/// True when any field is a hard stop or a review warning; such submissions start
/// as Pending, all others are approved automatically.
[[nodiscard]] bool requires_head_office_review(const core::ValidationResult& result) noexcept;

}  // namespace shelfcheck::app
