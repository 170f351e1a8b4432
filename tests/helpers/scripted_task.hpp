#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "taskwait/result.hpp"
#include "taskwait/task.hpp"

namespace taskwait::support {

// Task that walks through a fixed list of statuses, one per status() call.
// Once the list is exhausted the last status repeats.
class ScriptedTask final : public Task {
 public:
  enum class LogMode {
    // log() never grows the log.
    fixed,
    // log() appends one line while the current status is a running status.
    append_while_running,
    // log() appends one line on every call.
    append_every_call,
  };

  explicit ScriptedTask(std::vector<std::string> plan,
                        StatusSet status_waiting = {"created", "submitted"},
                        StatusSet status_running = {"running", "finishing"})
      : Task(std::move(status_waiting), std::move(status_running)), plan_(std::move(plan)) {}

  Result<std::string> status() override {
    ++status_calls;
    if (on_status) {
      on_status(status_calls);
    }
    if (status_error && status_calls == status_error_on_call) {
      return *status_error;
    }
    if (plan_.empty()) {
      return Error{make_error_code(errc::status_failed), "empty plan"};
    }
    current_ = plan_[next_ < plan_.size() ? next_ : plan_.size() - 1];
    ++next_;
    return current_;
  }

  Result<LogLines> log() override {
    ++log_calls;
    if (log_error) {
      return *log_error;
    }
    if (log_mode == LogMode::append_every_call ||
        (log_mode == LogMode::append_while_running && is_running(current_))) {
      lines.push_back("Log entry " + std::to_string(lines.size() + 1));
    }
    if (lines.empty()) {
      return std::nullopt;
    }
    return lines;
  }

  [[nodiscard]] bool has_log() const override { return logs; }

  bool logs = false;
  LogMode log_mode = LogMode::fixed;
  std::vector<std::string> lines;

  int status_calls = 0;
  int log_calls = 0;
  std::function<void(int)> on_status;

  std::optional<Error> status_error;
  int status_error_on_call = -1;
  std::optional<Error> log_error;

 private:
  std::vector<std::string> plan_;
  std::size_t next_ = 0;
  std::string current_;
};

}  // namespace taskwait::support
