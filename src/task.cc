#include "taskwait/task.hpp"

#include <algorithm>
#include <utility>

namespace taskwait {

Task::Task(StatusSet status_waiting, StatusSet status_running)
    : status_waiting_(std::move(status_waiting)), status_running_(std::move(status_running)) {}

bool Task::is_waiting(std::string_view status) const {
  return status_waiting_.find(status) != status_waiting_.end();
}

bool Task::is_running(std::string_view status) const {
  return status_running_.find(status) != status_running_.end();
}

bool Task::status_sets_overlap() const {
  return std::any_of(status_waiting_.begin(), status_waiting_.end(),
                     [this](const std::string& status) { return is_running(status); });
}

}  // namespace taskwait
