#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>

#include "taskwait/file_task.hpp"
#include "taskwait/wait.hpp"

// Usage: file_task_wait <job-dir> [timeout-seconds]
//
// Waits for <job-dir>/status to leave "created", "queued" and "running",
// printing new lines of <job-dir>/log as they appear.
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <job-dir> [timeout-seconds]\n";
    return 2;
  }

  static plog::ConsoleAppender<plog::TxtFormatter> console_appender(plog::streamStdErr);
  plog::init(plog::info, &console_appender);

  taskwait::FileTask task(argv[1]);
  taskwait::WaitOptions options;
  if (argc > 2) {
    try {
      options.timeout = std::chrono::seconds(std::stol(argv[2]));
    } catch (const std::exception& ex) {
      std::cerr << "invalid timeout '" << argv[2] << "': " << ex.what() << "\n";
      return 2;
    }
  }

  auto result = taskwait::wait(task, options);
  if (!result) {
    std::cerr << "wait failed: " << result.error().context << " "
              << result.error().code.message() << "\n";
    return 1;
  }

  std::cout << "status: " << result->status() << "\n";
  return 0;
}
