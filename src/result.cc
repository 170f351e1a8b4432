#include "taskwait/result.hpp"

namespace taskwait {

namespace {

class taskwait_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "taskwait"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::invalid_options:
        return "invalid wait options";
      case errc::invalid_task:
        return "invalid task";
      case errc::status_failed:
        return "status query failed";
      case errc::log_failed:
        return "log query failed";
      case errc::timeout:
        return "timeout";
    }
    return "unknown error";
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static taskwait_error_category category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

namespace internal {

[[noreturn]] void throw_error(const Error& error) {
  const std::string what = error.context.empty() ? error.code.message() : error.context;
  if (error.code == make_error_code(errc::timeout)) {
    throw TimeoutError(what);
  }
  if (error.code.category() == std::system_category()) {
    throw std::system_error(error.code, error.context);
  }
  throw std::runtime_error(what);
}

}  // namespace internal

}  // namespace taskwait
