#pragma once

#include <shelfcheck/core/catalog_entry.hpp>
#include <shelfcheck/core/error.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <expected>
#include <istream>
#include <string>
#include <vector>

namespace shelfcheck::app {

/// Column headers of the head-office product export.
inline constexpr const char* kNameColumn = "ProductName";
inline constexpr const char* kCategoryColumn = "Category";
inline constexpr const char* kPriceColumn = "PriceGBP";
inline constexpr const char* kAgeFlagColumn = "AgeVerificationRequired";

struct CatalogLoadResult {
  core::Catalog catalog;
  /// Operator-facing notes: missing optional columns, unparseable prices.
  std::vector<std::string> warnings;
};

/// Load the reference catalog from CSV.
/// ProductName is required. Category, PriceGBP and AgeVerificationRequired may be
/// missing; each missing column is reported in warnings and defaulted ("Unknown",
/// no price, no flag). Columns not listed above are kept as entry attributes.
/// Fails with DataError when the file cannot be read, lacks ProductName or has no rows.
[[nodiscard]] std::expected<CatalogLoadResult, core::Error> load_catalog_csv(const std::string& path);

/// Same as load_catalog_csv on an open stream; source_name is used in messages.
[[nodiscard]] std::expected<CatalogLoadResult, core::Error> parse_catalog_csv(
    std::istream& in, const std::string& source_name);

struct SubmissionBatch {
  std::vector<core::ProductSubmission> submissions;
  std::vector<std::string> warnings;  // rows skipped, with line numbers
};

/// Load store submissions to validate in bulk. Same columns as the catalog;
/// ProductName and PriceGBP are required. Rows whose price is not a number are
/// skipped and reported in warnings.
[[nodiscard]] std::expected<SubmissionBatch, core::Error> load_submission_batch_csv(
    const std::string& path);

}  // namespace shelfcheck::app
