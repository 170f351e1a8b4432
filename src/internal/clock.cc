#include "taskwait/internal/clock.hpp"

#include <atomic>
#include <thread>

namespace taskwait::internal {

namespace {

class SystemClock final : public Clock {
 public:
  time_point now() override { return std::chrono::steady_clock::now(); }

  std::chrono::system_clock::time_point wall_now() override {
    return std::chrono::system_clock::now();
  }

  void sleep_for(duration amount) override { std::this_thread::sleep_for(amount); }
};

std::atomic<Clock*> g_clock_override{nullptr};

}  // namespace

ScopedClockOverride::ScopedClockOverride(Clock& clock)
    : previous_(g_clock_override.exchange(&clock)) {}

ScopedClockOverride::~ScopedClockOverride() { g_clock_override.store(previous_); }

Clock& default_clock() {
  if (auto* override_clock = g_clock_override.load()) {
    return *override_clock;
  }
  static SystemClock clock;
  return clock;
}

}  // namespace taskwait::internal
