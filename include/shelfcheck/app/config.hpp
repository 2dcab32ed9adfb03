#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace shelfcheck::app {

/// How explanations are produced for validation results.
enum class ExplainerType {
  None,
  Template,
};

/// Engine and application configuration.
struct EngineConfig {
  std::string catalog_path;
  std::string submissions_path;
  std::size_t top_k{15};
  std::size_t num_workers{0};  // 0 = hardware concurrency
  ExplainerType explainer{ExplainerType::Template};

  /// Problems found while loading (bad numbers, unknown values); defaults were kept.
  std::vector<std::string> warnings;
};

/// Load config from a simple key=value file (one per line, '#' comments).
/// A missing file yields defaults; unknown keys are ignored.
EngineConfig load_config(const std::string& path);

/// Default config when no file is provided.
EngineConfig default_config();

}  // namespace shelfcheck::app
