#include "taskwait/wait.hpp"

#include <utility>

#include <plog/Log.h>

#include "taskwait/internal/clock.hpp"
#include "taskwait/internal/session.hpp"

namespace taskwait {

Result<WaitResult> wait(Task& task, const WaitOptions& options) {
  auto& clock = internal::default_clock();
  auto session = internal::open_session(task, options, clock);
  if (!session) {
    return session.error();
  }

  auto started = internal::wait_to_start(*session);
  if (!started) {
    return started.error();
  }
  auto finished = internal::wait_to_finish(*session);
  if (!finished) {
    return finished.error();
  }

  PLOG_DEBUG << "task finished with status: " << session->status;
  return WaitResult(session->status, session->start, clock.wall_now());
}

WaitResult wait_or_throw(Task& task, const WaitOptions& options) {
  auto result = wait(task, options);
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result).value();
}

}  // namespace taskwait
