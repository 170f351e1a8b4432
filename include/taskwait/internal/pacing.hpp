#pragma once

#include <optional>

#include "taskwait/internal/clock.hpp"
#include "taskwait/result.hpp"

namespace taskwait::internal {

// Space consecutive status polls at least `poll` apart.
//
// With no previous poll the current time is returned immediately. Otherwise
// fails with errc::timeout if the clock is already past `deadline`, then sleeps
// whatever is left of `poll` since `previous` and returns the time after the
// sleep. A missing deadline never expires.
Result<Clock::time_point> pace(Clock& clock, std::optional<Clock::time_point> previous,
                               Clock::duration poll, std::optional<Clock::time_point> deadline);

}  // namespace taskwait::internal
