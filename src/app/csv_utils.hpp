#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shelfcheck::app::detail {

/// One CSV record and the (1-based) line it starts on.
struct CsvRow {
  std::size_t line{0};
  std::vector<std::string> fields;
};

/// Read RFC 4180 style CSV: quoted fields may hold commas, newlines and "" escapes.
/// CRLF line endings are accepted; blank lines are skipped.
std::vector<CsvRow> read_csv(std::istream& in);

std::string trim(std::string_view s);

/// Column position by exact (trimmed) header name.
std::optional<std::size_t> find_column(const std::vector<std::string>& header, std::string_view name);

}  // namespace shelfcheck::app::detail
