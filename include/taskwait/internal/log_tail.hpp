#pragma once

#include <cstddef>
#include <ostream>

#include "taskwait/task.hpp"

namespace taskwait::internal {

// Write the lines of `lines` past the first `skip` to `out`, one per line, and
// return the new cursor. Absent logs and logs no longer than `skip` write
// nothing and return `skip`.
std::size_t tail_log(std::ostream& out, std::size_t skip, const LogLines& lines);

}  // namespace taskwait::internal
