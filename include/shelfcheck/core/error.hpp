#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace shelfcheck::core {

/// Error kinds; used with std::expected for recoverable failures.
enum class ErrorKind : std::uint8_t {
  DataError,             // catalog missing, unreadable or empty
  ValidationInputError,  // structurally invalid input, e.g. non-numeric price
  NotFound,
  StorageError,
  ExplainerError,
};

struct Error {
  ErrorKind kind{ErrorKind::DataError};
  std::string message;
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

}  // namespace shelfcheck::core
