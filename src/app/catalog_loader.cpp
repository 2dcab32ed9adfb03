#include <shelfcheck/app/catalog_loader.hpp>
#include "csv_utils.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <optional>
#include <utility>

namespace shelfcheck::app {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
  });
  return s;
}

void strip_bom(std::vector<std::string>& header) {
  if (!header.empty() && header[0].rfind("\xEF\xBB\xBF", 0) == 0) {
    header[0].erase(0, 3);
  }
}

std::string field_at(const detail::CsvRow& row, std::optional<std::size_t> col) {
  if (!col || *col >= row.fields.size()) return {};
  return detail::trim(row.fields[*col]);
}

std::optional<double> parse_number(const std::string& text) {
  double v = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(v)) {
    return std::nullopt;
  }
  return v;
}

std::optional<bool> parse_flag(const std::string& text) {
  if (text.empty()) return std::nullopt;
  return lower(text) == "yes";
}

std::string location(const std::string& source, std::size_t line) {
  return source + ":" + std::to_string(line);
}

}  // namespace

std::expected<CatalogLoadResult, core::Error> parse_catalog_csv(std::istream& in,
                                                                const std::string& source_name) {
  std::vector<detail::CsvRow> rows = detail::read_csv(in);
  if (rows.empty()) {
    return std::unexpected(
        core::Error{core::ErrorKind::DataError, source_name + ": catalog file is empty"});
  }

  std::vector<std::string> header = std::move(rows.front().fields);
  strip_bom(header);
  const auto name_col = detail::find_column(header, kNameColumn);
  if (!name_col) {
    return std::unexpected(core::Error{core::ErrorKind::DataError,
                                       source_name + ": missing required column '" +
                                           std::string(kNameColumn) + "'"});
  }

  CatalogLoadResult out;
  const auto category_col = detail::find_column(header, kCategoryColumn);
  const auto price_col = detail::find_column(header, kPriceColumn);
  const auto flag_col = detail::find_column(header, kAgeFlagColumn);
  if (!category_col) {
    out.warnings.push_back(source_name + ": column '" + std::string(kCategoryColumn) +
                           "' missing; every product defaults to category '" +
                           core::kUnknownCategory + "'");
  }
  if (!price_col) {
    out.warnings.push_back(source_name + ": column '" + std::string(kPriceColumn) +
                           "' missing; price checks will accept every price");
  }
  if (!flag_col) {
    out.warnings.push_back(source_name + ": column '" + std::string(kAgeFlagColumn) +
                           "' missing; age checks rely on policy only");
  }

  out.catalog.reserve(rows.size() - 1);
  for (std::size_t r = 1; r < rows.size(); ++r) {
    const detail::CsvRow& row = rows[r];
    core::CatalogEntry e;
    e.name = field_at(row, name_col);
    const std::string category = field_at(row, category_col);
    e.category = category.empty() ? core::kUnknownCategory : category;

    const std::string price_text = field_at(row, price_col);
    if (!price_text.empty()) {
      e.price = parse_number(price_text);
      if (!e.price) {
        out.warnings.push_back(location(source_name, row.line) + ": price '" + price_text +
                               "' is not a number; treated as missing");
      } else if (*e.price < 0.0) {
        out.warnings.push_back(location(source_name, row.line) + ": negative price '" +
                               price_text + "' treated as missing");
        e.price.reset();
      }
    }
    e.age_verification_required = parse_flag(field_at(row, flag_col));

    for (std::size_t c = 0; c < header.size(); ++c) {
      if (c == name_col || c == category_col || c == price_col || c == flag_col) continue;
      e.attributes.emplace_back(detail::trim(header[c]),
                                c < row.fields.size() ? detail::trim(row.fields[c]) : "");
    }
    out.catalog.push_back(std::move(e));
  }

  if (out.catalog.empty()) {
    return std::unexpected(
        core::Error{core::ErrorKind::DataError, source_name + ": catalog has no product rows"});
  }
  return out;
}

std::expected<CatalogLoadResult, core::Error> load_catalog_csv(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return std::unexpected(
        core::Error{core::ErrorKind::DataError, "cannot open catalog file '" + path + "'"});
  }
  return parse_catalog_csv(f, path);
}

std::expected<SubmissionBatch, core::Error> load_submission_batch_csv(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return std::unexpected(core::Error{core::ErrorKind::ValidationInputError,
                                       "cannot open submission file '" + path + "'"});
  }
  std::vector<detail::CsvRow> rows = detail::read_csv(f);
  if (rows.empty()) return SubmissionBatch{};

  std::vector<std::string> header = std::move(rows.front().fields);
  strip_bom(header);
  const auto name_col = detail::find_column(header, kNameColumn);
  const auto category_col = detail::find_column(header, kCategoryColumn);
  const auto price_col = detail::find_column(header, kPriceColumn);
  const auto flag_col = detail::find_column(header, kAgeFlagColumn);
  if (!name_col || !price_col) {
    return std::unexpected(core::Error{
        core::ErrorKind::ValidationInputError,
        path + ": submissions need '" + std::string(kNameColumn) + "' and '" +
            std::string(kPriceColumn) + "' columns"});
  }

  SubmissionBatch batch;
  for (std::size_t r = 1; r < rows.size(); ++r) {
    const detail::CsvRow& row = rows[r];
    auto parsed = core::parse_submission(field_at(row, name_col), field_at(row, category_col),
                                         field_at(row, price_col), field_at(row, flag_col));
    if (!parsed) {
      batch.warnings.push_back(location(path, row.line) + ": skipped, " + parsed.error().message);
      continue;
    }
    batch.submissions.push_back(std::move(*parsed));
  }
  return batch;
}

}  // namespace shelfcheck::app
