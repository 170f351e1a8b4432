#pragma once

#include <chrono>
#include <optional>
#include <ostream>

#include "taskwait/result.hpp"
#include "taskwait/task.hpp"
#include "taskwait/wait_result.hpp"

namespace taskwait {

/// @brief Wait configuration.
struct WaitOptions {
  /// @brief Default interval between status polls.
  static constexpr std::chrono::milliseconds kDefaultPoll{1000};
  /// @brief Print new log lines while running (only if the task has logs).
  bool show_log = true;
  /// @brief Print a dotted progress indicator. Ignored while logs are shown.
  bool show_progress = true;
  /// @brief Minimum interval between status polls. Zero never sleeps.
  std::chrono::milliseconds poll{kDefaultPoll};
  /// @brief Give up after this long. Unset waits forever.
  std::optional<std::chrono::milliseconds> timeout;
  /// @brief Destination for progress and log lines (nullptr = std::cout).
  std::ostream* output = nullptr;
  /// @brief Reject tasks whose waiting and running status sets overlap.
  bool strict_status_sets = false;
};

/// @brief Block until `task` reaches a terminal status.
///
/// Returns errc::timeout if the deadline passes first, errc::invalid_options
/// or errc::invalid_task for bad input, and any error reported by the task
/// unchanged.
[[nodiscard]] Result<WaitResult> wait(Task& task, const WaitOptions& options = {});

/// @brief Wait and throw on error (TimeoutError on timeout).
WaitResult wait_or_throw(Task& task, const WaitOptions& options = {});

}  // namespace taskwait
