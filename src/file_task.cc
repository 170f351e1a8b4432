#include "taskwait/file_task.hpp"

#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include <plog/Log.h>

namespace taskwait {

namespace {

constexpr const char* kStatusFile = "status";
constexpr const char* kLogFile = "log";
constexpr const char* kWhitespace = " \t\r\n";

std::string trim(const std::string& value) {
  auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return {};
  }
  auto last = value.find_last_not_of(kWhitespace);
  return value.substr(first, last - first + 1);
}

// Returns nullopt when the file does not exist.
Result<std::optional<std::string>> read_file(const std::filesystem::path& path, errc on_error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      return Error{ec, "stat " + path.string()};
    }
    return std::optional<std::string>();
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    return Error{make_error_code(on_error), "not a regular file: " + path.string()};
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Error{make_error_code(on_error), "open " + path.string()};
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return Error{make_error_code(on_error), "read " + path.string()};
  }
  return std::optional<std::string>(std::move(content));
}

std::vector<std::string> split_lines(const std::string& content, bool keep_partial) {
  std::vector<std::string> lines;
  std::size_t begin = 0;
  while (begin < content.size()) {
    auto end = content.find('\n', begin);
    if (end == std::string::npos) {
      if (!keep_partial) {
        break;
      }
      end = content.size();
    }
    auto line = content.substr(begin, end - begin);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    begin = end + 1;
  }
  return lines;
}

}  // namespace

FileTask::FileTask(std::filesystem::path dir, FileTaskOptions options)
    : Task(std::move(options.status_waiting), std::move(options.status_running)),
      dir_(std::move(dir)),
      missing_status_(std::move(options.missing_status)),
      has_log_(options.has_log) {}

Result<std::string> FileTask::status() {
  auto content = read_file(dir_ / kStatusFile, errc::status_failed);
  if (!content) {
    return content.error();
  }

  // An empty file is a status being rewritten; keep the last one seen.
  std::string status = last_status_.empty() ? missing_status_ : last_status_;
  if (content->has_value()) {
    auto newline = (*content)->find('\n');
    auto written = trim((*content)->substr(0, newline));
    if (!written.empty()) {
      status = std::move(written);
    }
  }
  last_status_ = status;
  finished_ = !is_waiting(status) && !is_running(status);
  if (finished_) {
    PLOG_DEBUG << "job " << dir_.string() << " reached status " << status;
  }
  return status;
}

Result<LogLines> FileTask::log() {
  auto content = read_file(dir_ / kLogFile, errc::log_failed);
  if (!content) {
    return content.error();
  }
  if (!content->has_value()) {
    return std::nullopt;
  }
  return split_lines(**content, finished_);
}

}  // namespace taskwait
