#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include "taskwait/task.hpp"
#include "taskwait/wait.hpp"

namespace {

// Moves one step through its lifecycle per status query and writes a log
// line per step while running.
class BuildTask final : public taskwait::Task {
 public:
  BuildTask() : taskwait::Task({"queued", "provisioning"}, {"compiling", "linking"}) {}

  taskwait::Result<std::string> status() override {
    if (step_ + 1 < kSteps.size()) {
      ++step_;
    }
    if (is_running(kSteps[step_])) {
      log_.push_back("[" + kSteps[step_] + "] step " + std::to_string(log_.size() + 1));
    }
    return kSteps[step_];
  }

  taskwait::Result<taskwait::LogLines> log() override {
    if (log_.empty()) {
      return std::nullopt;
    }
    return log_;
  }

  [[nodiscard]] bool has_log() const override { return true; }

 private:
  inline static const std::vector<std::string> kSteps = {
      "queued", "queued", "provisioning", "compiling", "compiling", "compiling", "linking",
      "succeeded"};

  std::size_t step_ = 0;
  std::vector<std::string> log_;
};

}  // namespace

int main(int argc, char** /*argv*/) {
  static plog::ConsoleAppender<plog::TxtFormatter> console_appender(plog::streamStdErr);
  plog::init(argc > 1 ? plog::debug : plog::info, &console_appender);

  BuildTask task;
  taskwait::WaitOptions options;
  options.poll = std::chrono::milliseconds(200);
  options.timeout = std::chrono::seconds(10);

  auto result = taskwait::wait(task, options);
  if (!result) {
    std::cerr << "wait failed: " << result.error().context << " "
              << result.error().code.message() << "\n";
    return 1;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(result->elapsed());
  PLOG_INFO << "task finished with status " << result->status() << " after " << elapsed.count()
            << "ms";
  return result->status() == "succeeded" ? 0 : 1;
}
