#pragma once

#include <shelfcheck/core/catalog_entry.hpp>
#include <cstddef>
#include <vector>

namespace shelfcheck::core {

/// Catalog entry similar to a query, with cosine similarity in [0, 1].
struct Neighbour {
  std::size_t catalog_index{0};
  CatalogEntry entry;
  double similarity{0.0};
};

/// Neighbours ordered by non-increasing similarity.
using NeighbourSet = std::vector<Neighbour>;

}  // namespace shelfcheck::core
