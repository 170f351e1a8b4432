#pragma once

#include <chrono>
#include <functional>
#include <vector>

#include "taskwait/internal/clock.hpp"

namespace taskwait::support {

// Virtual clock: sleeping advances time instantly.
class FakeClock final : public internal::Clock {
 public:
  static constexpr std::chrono::hours kOrigin{24};

  time_point now() override { return now_; }

  std::chrono::system_clock::time_point wall_now() override {
    return std::chrono::system_clock::time_point{} +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(
               now_.time_since_epoch());
  }

  void sleep_for(duration amount) override {
    sleep_calls.push_back(amount);
    now_ += amount;
    if (on_sleep) {
      on_sleep();
    }
  }

  void advance(duration amount) { now_ += amount; }

  std::vector<duration> sleep_calls;
  std::function<void()> on_sleep;

 private:
  time_point now_{kOrigin};
};

}  // namespace taskwait::support
