#include <shelfcheck/similarity/catalog_index.hpp>
#include <algorithm>
#include <utility>

namespace shelfcheck::similarity {

namespace {

bool is_blank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

CatalogIndex::CatalogIndex(core::Catalog catalog,
                           TfidfVectorizer model,
                           std::vector<SparseVector> rows)
    : catalog_(std::move(catalog)), model_(std::move(model)), rows_(std::move(rows)) {
  categories_.reserve(catalog_.size());
  for (const auto& e : catalog_) categories_.push_back(e.category);
  std::sort(categories_.begin(), categories_.end());
  categories_.erase(std::unique(categories_.begin(), categories_.end()), categories_.end());
}

std::expected<std::shared_ptr<const CatalogIndex>, core::Error> CatalogIndex::build(
    core::Catalog catalog) {
  if (catalog.empty()) {
    return std::unexpected(core::Error{core::ErrorKind::DataError, "reference catalog is empty"});
  }

  std::vector<std::string> names;
  names.reserve(catalog.size());
  for (auto& e : catalog) {
    if (is_blank(e.category)) e.category = core::kUnknownCategory;
    names.push_back(e.name);
  }

  TfidfVectorizer model = TfidfVectorizer::fit(names);
  std::vector<SparseVector> rows;
  rows.reserve(names.size());
  for (const auto& name : names) rows.push_back(model.transform(name));

  return std::shared_ptr<const CatalogIndex>(
      new CatalogIndex(std::move(catalog), std::move(model), std::move(rows)));
}

}  // namespace shelfcheck::similarity
