#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shelfcheck::core {

/// Category assigned to catalog rows that carry none.
inline constexpr const char* kUnknownCategory = "Unknown";

/// One reference product maintained by head office.
struct CatalogEntry {
  std::string name;
  std::string category{kUnknownCategory};
  std::optional<double> price;
  std::optional<bool> age_verification_required;
  /// Extra descriptive columns as (column, value), in file order.
  std::vector<std::pair<std::string, std::string>> attributes;
};

/// Ordered reference catalog; positions are stable for the lifetime of an index.
using Catalog = std::vector<CatalogEntry>;

}  // namespace shelfcheck::core
