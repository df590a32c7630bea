#pragma once

#include <chrono>
#include <mutex>

namespace atomicswap::util {

using TimePoint = std::chrono::system_clock::time_point;

/*
  Injectable wall clock.

  Timelocks are absolute instants, so every expiry decision goes through
  one of these instead of calling system_clock directly.
*/
class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override {
    return std::chrono::system_clock::now();
  }
};

// Test clock; only moves when told to.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = std::chrono::system_clock::now()) : now_(start) {
  }

  TimePoint Now() const override {
    std::lock_guard lock(mutex_);
    return now_;
  }

  void Advance(std::chrono::system_clock::duration d) {
    std::lock_guard lock(mutex_);
    now_ += d;
  }

  void Set(TimePoint tp) {
    std::lock_guard lock(mutex_);
    now_ = tp;
  }

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

} // namespace atomicswap::util
