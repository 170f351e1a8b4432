#include "taskwait/internal/pacing.hpp"

#include <plog/Log.h>

namespace taskwait::internal {

Result<Clock::time_point> pace(Clock& clock, std::optional<Clock::time_point> previous,
                               Clock::duration poll, std::optional<Clock::time_point> deadline) {
  auto now = clock.now();
  if (!previous) {
    return now;
  }
  if (deadline && now > *deadline) {
    PLOG_WARNING << "wait deadline passed before task finished";
    return Error{make_error_code(errc::timeout), "timeout"};
  }

  auto remaining = poll - (now - *previous);
  if (remaining > Clock::duration::zero()) {
    clock.sleep_for(remaining);
    now = clock.now();
  }
  return now;
}

}  // namespace taskwait::internal
