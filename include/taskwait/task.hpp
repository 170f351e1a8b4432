#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "taskwait/result.hpp"

namespace taskwait {

/// @brief Set of status strings that share a phase.
using StatusSet = std::set<std::string, std::less<>>;

/// @brief Log lines produced so far, or nullopt when there are none yet.
using LogLines = std::optional<std::vector<std::string>>;

/// @brief An externally managed task that can be polled until it finishes.
///
/// Implementations report how the task is doing; taskwait only polls. The
/// waiting/running status sets are fixed at construction. A status outside
/// both sets is terminal.
class Task {
 public:
  /// @brief Construct with the statuses meaning "waiting" and "running".
  Task(StatusSet status_waiting, StatusSet status_running);
  virtual ~Task() = default;

  /// @brief Query the current status. May block.
  virtual Result<std::string> status() = 0;
  /// @brief Full log produced so far. Each call must return the previous
  /// result with zero or more lines appended.
  virtual Result<LogLines> log() = 0;
  /// @brief True if this task may produce logs, now or later.
  [[nodiscard]] virtual bool has_log() const = 0;

  /// @brief Statuses meaning the task has not started yet.
  [[nodiscard]] const StatusSet& status_waiting() const noexcept { return status_waiting_; }
  /// @brief Statuses meaning the task is executing.
  [[nodiscard]] const StatusSet& status_running() const noexcept { return status_running_; }

  /// @brief True if `status` is a waiting status.
  [[nodiscard]] bool is_waiting(std::string_view status) const;
  /// @brief True if `status` is a running status.
  [[nodiscard]] bool is_running(std::string_view status) const;
  /// @brief True if the two status sets share any entry.
  [[nodiscard]] bool status_sets_overlap() const;

 private:
  const StatusSet status_waiting_;
  const StatusSet status_running_;
};

}  // namespace taskwait
