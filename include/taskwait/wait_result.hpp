#pragma once

#include <chrono>
#include <string>

namespace taskwait {

/// @brief Final outcome of a successful wait.
class WaitResult {
 public:
  /// @brief Wall-clock time point used for start/end.
  using time_point = std::chrono::system_clock::time_point;

  /// @brief Construct a result for a task that reached `status`.
  WaitResult(std::string status, time_point start, time_point end);

  /// @brief Terminal status, as returned by Task::status().
  [[nodiscard]] const std::string& status() const noexcept { return status_; }
  /// @brief Wall-clock time the wait began.
  [[nodiscard]] time_point start() const noexcept { return start_; }
  /// @brief Wall-clock time the wait concluded.
  [[nodiscard]] time_point end() const noexcept { return end_; }
  /// @brief Time spent waiting (end - start).
  [[nodiscard]] std::chrono::system_clock::duration elapsed() const noexcept;

 private:
  std::string status_;
  time_point start_;
  time_point end_;
};

}  // namespace taskwait
