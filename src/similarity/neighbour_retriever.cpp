#include <shelfcheck/similarity/neighbour_retriever.hpp>
#include <algorithm>
#include <cstddef>
#include <numeric>

namespace shelfcheck::similarity {

std::vector<double> score_all(const CatalogIndex& index, std::string_view query_name) {
  const SparseVector query = index.model().transform(query_name);
  std::vector<double> scores(index.size(), 0.0);
  if (query.empty()) return scores;
  for (std::size_t i = 0; i < index.size(); ++i) {
    scores[i] = std::clamp(dot(query, index.row(i)), 0.0, 1.0);
  }
  return scores;
}

core::NeighbourSet retrieve(const CatalogIndex& index, std::string_view query_name, std::size_t k) {
  const std::vector<double> scores = score_all(index, query_name);
  const std::size_t n = std::min(k, scores.size());

  std::vector<std::size_t> order(scores.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  // Index tiebreak makes the partial sort equivalent to a stable descending sort.
  std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(n), order.end(),
                    [&scores](std::size_t a, std::size_t b) {
                      if (scores[a] != scores[b]) return scores[a] > scores[b];
                      return a < b;
                    });

  core::NeighbourSet out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t idx = order[i];
    out.push_back(core::Neighbour{idx, index.catalog()[idx], scores[idx]});
  }
  return out;
}

}  // namespace shelfcheck::similarity
