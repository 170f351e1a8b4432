#include "taskwait/wait_result.hpp"

#include <utility>

namespace taskwait {

WaitResult::WaitResult(std::string status, time_point start,
                       time_point end)  // NOLINT(bugprone-easily-swappable-parameters)
    : status_(std::move(status)), start_(start), end_(end) {}

std::chrono::system_clock::duration WaitResult::elapsed() const noexcept { return end_ - start_; }

}  // namespace taskwait
