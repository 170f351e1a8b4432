#include "taskwait/internal/session.hpp"

#include <iostream>
#include <utility>

#include <plog/Log.h>

#include "taskwait/internal/log_tail.hpp"
#include "taskwait/internal/pacing.hpp"
#include "taskwait/internal/progress.hpp"

namespace taskwait::internal {

namespace {

Result<void> validate(const Task& task, const WaitOptions& options) {
  if (options.poll < std::chrono::milliseconds::zero()) {
    return Error{make_error_code(errc::invalid_options), "poll interval is negative"};
  }
  if (options.timeout && *options.timeout < std::chrono::milliseconds::zero()) {
    return Error{make_error_code(errc::invalid_options), "timeout is negative"};
  }
  if (options.strict_status_sets && task.status_sets_overlap()) {
    return Error{make_error_code(errc::invalid_task), "waiting and running statuses overlap"};
  }
  return {};
}

}  // namespace

Result<WaitSession> open_session(Task& task, const WaitOptions& options, Clock& clock) {
  auto valid = validate(task, options);
  if (!valid) {
    return valid.error();
  }

  WaitSession session;
  session.task = &task;
  session.clock = &clock;
  session.out = options.output != nullptr ? options.output : &std::cout;
  session.show_log = options.show_log && task.has_log();
  session.show_progress = options.show_progress && !session.show_log;
  // Intervals beyond the steady clock's range are clamped; such a timeout
  // never expires.
  constexpr auto kMaxPoll =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max());
  session.poll =
      options.poll < kMaxPoll ? Clock::duration(options.poll) : Clock::duration::max();
  session.start = clock.wall_now();
  if (options.timeout) {
    auto now = clock.now();
    auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (*options.timeout < headroom) {
      session.deadline = now + *options.timeout;
    }
  }

  PLOG_DEBUG << "waiting on task: show_log=" << session.show_log
             << " show_progress=" << session.show_progress << " poll=" << options.poll.count()
             << "ms timeout="
             << (options.timeout ? std::to_string(options.timeout->count()) + "ms" : "none");

  auto status = task.status();
  if (!status) {
    return status.error();
  }
  session.status = std::move(status).value();
  PLOG_DEBUG << "initial task status: " << session.status;
  return session;
}

Result<void> wait_to_start(WaitSession& session) {
  ScopedProgress progress(*session.out, "Waiting", session.show_progress);
  while (session.task->is_waiting(session.status)) {
    progress.tick();
    auto polled = poll_status(session);
    if (!polled) {
      return polled.error();
    }
  }
  return {};
}

Result<void> wait_to_finish(WaitSession& session) {
  {
    ScopedProgress progress(*session.out, "Running", session.show_progress);
    if (session.task->is_running(session.status)) {
      PLOG_DEBUG << "task running: " << session.status;
    }
    while (session.task->is_running(session.status)) {
      progress.tick();
      auto shown = show_new_log(session);
      if (!shown) {
        return shown.error();
      }
      auto polled = poll_status(session);
      if (!polled) {
        return polled.error();
      }
    }
  }
  return show_new_log(session);
}

Result<void> poll_status(WaitSession& session) {
  auto paced = pace(*session.clock, session.last_poll, session.poll, session.deadline);
  if (!paced) {
    return paced.error();
  }
  session.last_poll = *paced;

  auto status = session.task->status();
  if (!status) {
    return status.error();
  }
  PLOG_VERBOSE << "task status: " << *status;
  session.status = std::move(status).value();
  return {};
}

Result<void> show_new_log(WaitSession& session) {
  if (!session.show_log) {
    return {};
  }
  auto lines = session.task->log();
  if (!lines) {
    return lines.error();
  }
  session.skip = tail_log(*session.out, session.skip, *lines);
  return {};
}

}  // namespace taskwait::internal
