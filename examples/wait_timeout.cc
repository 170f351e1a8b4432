#include <chrono>
#include <iostream>
#include <string>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>

#include "taskwait/result.hpp"
#include "taskwait/task.hpp"
#include "taskwait/wait.hpp"

namespace {

class StuckTask final : public taskwait::Task {
 public:
  StuckTask() : taskwait::Task({"pending"}, {"running"}) {}

  taskwait::Result<std::string> status() override { return std::string("running"); }
  taskwait::Result<taskwait::LogLines> log() override { return std::nullopt; }
  [[nodiscard]] bool has_log() const override { return false; }
};

}  // namespace

int main() {
  static plog::ConsoleAppender<plog::TxtFormatter> console_appender(plog::streamStdErr);
  plog::init(plog::warning, &console_appender);

  StuckTask task;
  taskwait::WaitOptions options;
  options.poll = std::chrono::milliseconds(10);
  options.timeout = std::chrono::milliseconds(50);

  auto result = taskwait::wait(task, options);
  if (result) {
    std::cerr << "expected timeout but task finished\n";
    return 1;
  }
  if (result.error().code != taskwait::make_error_code(taskwait::errc::timeout)) {
    std::cerr << "unexpected wait error: " << result.error().code.message() << "\n";
    return 1;
  }

  try {
    (void)taskwait::wait_or_throw(task, options);
    std::cerr << "expected TimeoutError\n";
    return 1;
  } catch (const taskwait::TimeoutError& ex) {
    std::cerr << "timed out: " << ex.what() << "\n";
  }

  return 0;
}
