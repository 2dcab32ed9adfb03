#include <shelfcheck/app/json_submission_repository.hpp>
#include <shelfcheck/app/json_codec.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace shelfcheck::app {

JsonSubmissionRepository::JsonSubmissionRepository(std::string path, TimestampSource clock)
    : InMemorySubmissionRepository(std::move(clock)), path_(std::move(path)) {}

std::expected<std::unique_ptr<JsonSubmissionRepository>, core::Error> JsonSubmissionRepository::open(
    std::string path, TimestampSource clock) {
  std::unique_ptr<JsonSubmissionRepository> repo(
      new JsonSubmissionRepository(std::move(path), std::move(clock)));

  std::error_code ec;
  if (!std::filesystem::exists(repo->path_, ec)) return repo;

  std::ifstream f(repo->path_, std::ios::binary);
  if (!f) {
    return std::unexpected(
        core::Error{core::ErrorKind::StorageError, "cannot read '" + repo->path_ + "'"});
  }
  std::ostringstream text;
  text << f.rdbuf();

  auto root = parse_json(text.str());
  if (!root) {
    return std::unexpected(
        core::Error{core::ErrorKind::StorageError, repo->path_ + ": " + root.error().message});
  }
  if (!root->isObject()) {
    return std::unexpected(core::Error{core::ErrorKind::StorageError,
                                       repo->path_ + ": expected a JSON object at the top level"});
  }
  const Json::Value& list = (*root)["submissions"];
  if (!list.isArray()) {
    return std::unexpected(core::Error{core::ErrorKind::StorageError,
                                       repo->path_ + ": expected a \"submissions\" array"});
  }

  std::vector<Submission> loaded;
  loaded.reserve(list.size());
  for (const auto& item : list) {
    auto s = submission_from_json(item);
    if (!s) {
      return std::unexpected(
          core::Error{core::ErrorKind::StorageError, repo->path_ + ": " + s.error().message});
    }
    loaded.push_back(std::move(*s));
  }
  repo->restore(std::move(loaded));
  return repo;
}

std::expected<void, core::Error> JsonSubmissionRepository::persist(
    const std::map<std::uint64_t, Submission>& submissions) {
  Json::Value list(Json::arrayValue);
  for (const auto& [id, s] : submissions) list.append(to_json(s));
  Json::Value root(Json::objectValue);
  root["submissions"] = std::move(list);

  const std::filesystem::path target(path_);
  std::error_code ec;
  if (target.has_parent_path()) std::filesystem::create_directories(target.parent_path(), ec);

  const std::filesystem::path tmp = target.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return std::unexpected(
          core::Error{core::ErrorKind::StorageError, "cannot write '" + tmp.string() + "'"});
    }
    out << write_json(root) << '\n';
    if (!out.flush()) {
      return std::unexpected(
          core::Error{core::ErrorKind::StorageError, "write failed for '" + tmp.string() + "'"});
    }
  }
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    return std::unexpected(core::Error{core::ErrorKind::StorageError,
                                       "cannot replace '" + path_ + "': " + ec.message()});
  }
  return {};
}

}  // namespace shelfcheck::app
