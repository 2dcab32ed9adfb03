#pragma once

#include <shelfcheck/core/neighbour.hpp>
#include <shelfcheck/similarity/catalog_index.hpp>
#include <cstddef>
#include <string_view>
#include <vector>

namespace shelfcheck::similarity {

/// Neighbours returned per query unless configured otherwise.
inline constexpr std::size_t kDefaultTopK = 15;

/// Cosine similarity of query_name to every catalog row, in catalog order, clamped to [0, 1].
[[nodiscard]] std::vector<double> score_all(const CatalogIndex& index, std::string_view query_name);

/// Top-k most similar catalog entries, by descending similarity; ties keep catalog order.
/// Returns min(k, catalog size) entries. A query sharing no vocabulary with the catalog
/// still returns entries, all at similarity 0.
/// Cost is linear in catalog size (brute force; no inverted index).
[[nodiscard]] core::NeighbourSet retrieve(const CatalogIndex& index,
                                          std::string_view query_name,
                                          std::size_t k = kDefaultTopK);

}  // namespace shelfcheck::similarity
