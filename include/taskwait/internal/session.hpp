#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include "taskwait/internal/clock.hpp"
#include "taskwait/result.hpp"
#include "taskwait/task.hpp"
#include "taskwait/wait.hpp"

namespace taskwait::internal {

// State of one wait, owned by the poll loop.
struct WaitSession {
  Task* task = nullptr;
  Clock* clock = nullptr;
  std::ostream* out = nullptr;

  bool show_log = false;
  bool show_progress = false;
  Clock::duration poll{};
  std::optional<Clock::time_point> deadline;
  std::optional<Clock::time_point> last_poll;

  std::string status;
  // Number of log lines already written to `out`.
  std::size_t skip = 0;
  std::chrono::system_clock::time_point start;
};

// Validate options, fix the deadline and take the initial status.
Result<WaitSession> open_session(Task& task, const WaitOptions& options, Clock& clock);

// Poll while the status is a waiting status.
Result<void> wait_to_start(WaitSession& session);

// Poll while the status is a running status, tailing the log, then flush any
// trailing log lines.
Result<void> wait_to_finish(WaitSession& session);

// Pace, then query the task status.
Result<void> poll_status(WaitSession& session);

// Write log lines not yet shown, if log display is on.
Result<void> show_new_log(WaitSession& session);

}  // namespace taskwait::internal
