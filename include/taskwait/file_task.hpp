#pragma once

#include <filesystem>
#include <string>

#include "taskwait/result.hpp"
#include "taskwait/task.hpp"

namespace taskwait {

/// @brief Configuration for FileTask.
struct FileTaskOptions {
  /// @brief Status reported while the status file does not exist yet.
  std::string missing_status = "created";
  /// @brief Whether the task exposes its log file.
  bool has_log = true;
  /// @brief Statuses meaning the job has not started.
  StatusSet status_waiting{"created", "queued"};
  /// @brief Statuses meaning the job is executing.
  StatusSet status_running{"running"};
};

/// @brief Task backed by a job directory on disk.
///
/// The status is the first line of `<dir>/status`, trimmed. The log is the
/// lines of `<dir>/log`. A trailing line without a newline is held back until
/// the job reaches a terminal status, so a half-written line is never shown.
class FileTask final : public Task {
 public:
  /// @brief Watch the job directory `dir`.
  explicit FileTask(std::filesystem::path dir, FileTaskOptions options = {});

  Result<std::string> status() override;
  Result<LogLines> log() override;
  [[nodiscard]] bool has_log() const override { return has_log_; }

  /// @brief Job directory being watched.
  [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

 private:
  std::filesystem::path dir_;
  std::string missing_status_;
  std::string last_status_;
  bool has_log_ = true;
  bool finished_ = false;
};

}  // namespace taskwait
