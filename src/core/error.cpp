#include <shelfcheck/core/error.hpp>

namespace shelfcheck::core {

std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::DataError:
      return "DataError";
    case ErrorKind::ValidationInputError:
      return "ValidationInputError";
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::StorageError:
      return "StorageError";
    case ErrorKind::ExplainerError:
      return "ExplainerError";
  }
  return "Unknown";
}

}  // namespace shelfcheck::core
