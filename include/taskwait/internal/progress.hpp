#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace taskwait::internal {

// Dotted progress indicator for one wait phase: prints `label` on
// construction, a dot per tick() and `done` plus a newline on destruction.
// Prints nothing when `display` is false.
class ScopedProgress {
 public:
  static constexpr std::string_view kDone = "OK";

  ScopedProgress(std::ostream& out, std::string_view label, bool display,
                 std::string_view done = kDone);
  ~ScopedProgress();
  ScopedProgress(const ScopedProgress&) = delete;
  ScopedProgress& operator=(const ScopedProgress&) = delete;

  void tick();

 private:
  std::ostream& out_;
  std::string done_;
  bool display_;
};

}  // namespace taskwait::internal
