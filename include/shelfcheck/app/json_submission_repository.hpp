#pragma once

#include <shelfcheck/app/submission_repository.hpp>
#include <shelfcheck/core/error.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>

namespace shelfcheck::app {

/// Submission repository persisted as one JSON document: {"submissions": [...]}.
/// The whole file is rewritten (via a temporary file and rename) after every mutation.
class JsonSubmissionRepository : public InMemorySubmissionRepository {
 public:
  /// Open or create the store at path. A missing file starts empty; an unreadable or
  /// malformed file fails with StorageError instead of being discarded.
  [[nodiscard]] static std::expected<std::unique_ptr<JsonSubmissionRepository>, core::Error> open(
      std::string path, TimestampSource clock = utc_timestamp_now);

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

 protected:
  [[nodiscard]] std::expected<void, core::Error> persist(
      const std::map<std::uint64_t, Submission>& submissions) override;

 private:
  JsonSubmissionRepository(std::string path, TimestampSource clock);

  std::string path_;
};

}  // namespace shelfcheck::app
