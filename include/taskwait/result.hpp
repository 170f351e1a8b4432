#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

#include "taskwait/internal/expected.hpp"

namespace taskwait {

/// @brief Error codes for taskwait operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // Configuration / API misuse
  /// @brief Negative poll interval or timeout.
  invalid_options,
  /// @brief Task status sets overlap (strict mode only).
  invalid_task,

  // Task capability failures
  /// @brief Task could not report its status.
  status_failed,
  /// @brief Task could not report its log.
  log_failed,

  // High-level
  /// @brief Wait deadline passed before the task finished.
  timeout,
};

/// @brief Error payload returned by taskwait APIs.
struct Error {
  /// @brief Error code (taskwait category, or whatever a Task reported).
  std::error_code code;
  /// @brief Human-readable context for the failure.
  std::string context;
};

/// @brief Exception thrown by *_or_throw helpers when the wait times out.
class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

/// @brief taskwait error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Create an error_code in the taskwait category.
std::error_code make_error_code(errc value) noexcept;

/// @brief Result type used by taskwait APIs (std::expected-like).
template <typename T>
using Result = expected<T, Error>;

namespace internal {
/// @brief Throw an error as an exception (used by *_or_throw helpers).
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace taskwait

namespace std {

/// @brief Enable implicit conversion from taskwait::errc to std::error_code.
template <>
struct is_error_code_enum<taskwait::errc> : true_type {};

}  // namespace std
