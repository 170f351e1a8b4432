#pragma once

#include <chrono>

namespace taskwait::internal {

class Clock {
 public:
  using time_point = std::chrono::steady_clock::time_point;
  using duration = std::chrono::steady_clock::duration;

  virtual ~Clock() = default;
  // Monotonic time, used for pacing and deadlines.
  virtual time_point now() = 0;
  // Wall-clock time, used for WaitResult start/end.
  virtual std::chrono::system_clock::time_point wall_now() = 0;
  virtual void sleep_for(duration amount) = 0;
};

class ScopedClockOverride {
 public:
  explicit ScopedClockOverride(Clock& clock);
  ~ScopedClockOverride();
  ScopedClockOverride(const ScopedClockOverride&) = delete;
  ScopedClockOverride& operator=(const ScopedClockOverride&) = delete;

 private:
  Clock* previous_ = nullptr;
};

Clock& default_clock();

}  // namespace taskwait::internal
