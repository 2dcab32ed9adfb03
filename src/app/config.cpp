#include <shelfcheck/app/config.hpp>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace shelfcheck::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_size(const std::string& value, std::size_t& out) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) return false;
  try {
    out = static_cast<std::size_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

}  // namespace

EngineConfig default_config() {
  EngineConfig c;
  c.catalog_path = "data/ho_products.csv";
  c.submissions_path = "submissions.json";
  c.top_k = 15;
  c.num_workers = 0;
  c.explainer = ExplainerType::Template;
  return c;
}

EngineConfig load_config(const std::string& path) {
  EngineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    const std::string where = path + ":" + std::to_string(line_no) + ": ";
    if (key == "catalog_path") c.catalog_path = value;
    else if (key == "submissions_path") c.submissions_path = value;
    else if (key == "top_k") {
      std::size_t k = 0;
      if (parse_size(value, k) && k > 0) c.top_k = k;
      else c.warnings.push_back(where + "top_k must be a positive integer, got '" + value + "'");
    }
    else if (key == "num_workers") {
      std::size_t n = 0;
      if (parse_size(value, n)) c.num_workers = n;
      else c.warnings.push_back(where + "num_workers must be an integer, got '" + value + "'");
    }
    else if (key == "explainer") {
      if (value == "template") c.explainer = ExplainerType::Template;
      else if (value == "none") c.explainer = ExplainerType::None;
      else c.warnings.push_back(where + "unknown explainer '" + value + "'");
    }
  }
  return c;
}

}  // namespace shelfcheck::app
