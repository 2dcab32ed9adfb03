#pragma once

#include <shelfcheck/core/catalog_entry.hpp>
#include <shelfcheck/core/error.hpp>
#include <shelfcheck/similarity/tfidf_vectorizer.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace shelfcheck::similarity {

/// Memory: the index owns the catalog, the fitted vectorizer and one normalised
/// vector per catalog row. It is immutable once built and handed out as
/// shared_ptr<const CatalogIndex>; any number of threads may read it without locking.
/// Reloading a catalog means building a new index and swapping the pointer.
class CatalogIndex {
 public:
  /// Fit the similarity model over catalog names.
  /// Empty categories become core::kUnknownCategory; empty names are kept as "".
  /// Fails with DataError if the catalog is empty.
  [[nodiscard]] static std::expected<std::shared_ptr<const CatalogIndex>, core::Error> build(
      core::Catalog catalog);

  [[nodiscard]] const core::Catalog& catalog() const noexcept { return catalog_; }
  [[nodiscard]] const TfidfVectorizer& model() const noexcept { return model_; }
  [[nodiscard]] std::size_t size() const noexcept { return catalog_.size(); }

  /// Normalised name vector of catalog row i.
  [[nodiscard]] const SparseVector& row(std::size_t i) const { return rows_.at(i); }

  /// Distinct categories, sorted.
  [[nodiscard]] const std::vector<std::string>& categories() const noexcept {
    return categories_;
  }

 private:
  CatalogIndex(core::Catalog catalog, TfidfVectorizer model, std::vector<SparseVector> rows);

  core::Catalog catalog_;
  TfidfVectorizer model_;
  std::vector<SparseVector> rows_;
  std::vector<std::string> categories_;
};

}  // namespace shelfcheck::similarity
