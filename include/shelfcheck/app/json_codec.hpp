#pragma once

#include <shelfcheck/app/submission.hpp>
#include <shelfcheck/core/decision.hpp>
#include <shelfcheck/core/error.hpp>
#include <shelfcheck/core/neighbour.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <shelfcheck/core/validation_result.hpp>
#include <json/json.h>
#include <expected>
#include <string>

namespace shelfcheck::app {

/// JSON shapes used by the submission file and by callers that expose results over HTTP.
/// Absent optionals are written as null. Neighbours use the catalog column names
/// (ProductName, Category, PriceGBP, AgeVerificationRequired) plus "similarity".

[[nodiscard]] Json::Value to_json(const core::FieldDecision& decision);
[[nodiscard]] Json::Value to_json(const core::Neighbour& neighbour);
[[nodiscard]] Json::Value to_json(const core::ValidationResult& result, bool include_neighbours = true);
[[nodiscard]] Json::Value to_json(const core::ProductSubmission& product);
[[nodiscard]] Json::Value to_json(const Submission& submission);

/// Inverse of to_json(ValidationResult) (neighbours are not read back).
[[nodiscard]] std::expected<core::ValidationResult, core::Error> validation_result_from_json(
    const Json::Value& value);

/// Inverse of to_json(Submission). Fails with StorageError on a missing or mistyped field.
[[nodiscard]] std::expected<Submission, core::Error> submission_from_json(const Json::Value& value);

[[nodiscard]] std::string write_json(const Json::Value& value, bool pretty = true);

/// Fails with StorageError when text is not valid JSON.
[[nodiscard]] std::expected<Json::Value, core::Error> parse_json(const std::string& text);

}  // namespace shelfcheck::app
