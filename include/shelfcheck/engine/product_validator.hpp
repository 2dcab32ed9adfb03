#pragma once

#include <shelfcheck/core/error.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <shelfcheck/core/validation_result.hpp>
#include <shelfcheck/similarity/catalog_index.hpp>
#include <shelfcheck/similarity/neighbour_retriever.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>

namespace shelfcheck::engine {

/// Validation phases, in the order they run.
enum class Phase : std::uint8_t {
  Retrieve,
  Infer,
  Classify,
  Aggregate,
};

/// Callback for per-phase timing: (phase, duration_ms). Optional; pass to validate().
using PhaseTimingCallback = std::function<void(Phase phase, double duration_ms)>;

struct ValidatorOptions {
  std::size_t top_k{similarity::kDefaultTopK};
};

/// Runs one submission through retrieval, field inference, the three field rules and
/// the aggregator.
///
/// The catalog index is held as an atomically swappable snapshot: validate() loads the
/// pointer once, so a concurrent replace_index() never exposes a half-built catalog to a
/// call in flight. Thread-safe: validate() may be called from any number of threads.
class ProductValidator {
 public:
  /// Validator without a catalog; validate() fails with DataError until replace_index().
  ProductValidator() = default;

  explicit ProductValidator(std::shared_ptr<const similarity::CatalogIndex> index,
                            ValidatorOptions options = {});

  ProductValidator(const ProductValidator&) = delete;
  ProductValidator& operator=(const ProductValidator&) = delete;

  /// Fails with DataError when no catalog is loaded and with ValidationInputError for a
  /// non-finite price. Empty or unknown field values are ordinary decision outcomes.
  /// If timing_cb is non-null, it is called after each phase.
  [[nodiscard]] std::expected<core::ValidationResult, core::Error> validate(
      const core::ProductSubmission& submission,
      PhaseTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::expected<core::ValidationResult, core::Error> validate_product(
      std::string_view product_name,
      std::string_view category,
      double price,
      std::string_view age_flag) const;

  /// Publish a fully built index; calls already running keep their snapshot.
  void replace_index(std::shared_ptr<const similarity::CatalogIndex> index);

  [[nodiscard]] std::shared_ptr<const similarity::CatalogIndex> index() const {
    return index_.load();
  }
  [[nodiscard]] bool ready() const { return index_.load() != nullptr; }
  [[nodiscard]] const ValidatorOptions& options() const noexcept { return options_; }

 private:
  std::atomic<std::shared_ptr<const similarity::CatalogIndex>> index_;
  ValidatorOptions options_;
};

}  // namespace shelfcheck::engine
