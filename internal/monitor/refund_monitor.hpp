#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/util/clock.hpp"

namespace atomicswap::core {
class SwapCoordinator;
}

namespace atomicswap::monitor {

struct RefundMonitorOptions {
  std::chrono::milliseconds interval{30000};
  bool                      cancel_expired_offers = false;
};

struct SweepStats {
  std::size_t refunded  = 0;
  std::size_t cancelled = 0;
  std::size_t skipped   = 0; // lost a race to another caller
  std::size_t failed    = 0; // backend or store error, retried next sweep
};

/*
  Background worker that unwinds expired swaps.

  Every interval it scans active and REFUNDED swaps and refunds each leg
  whose timelock passed while the lock is still outstanding. Refunds go
  through the coordinator, so they take the same per-swap lock and
  version check as a client call.
*/
class RefundMonitor {
 public:
  RefundMonitor(std::shared_ptr<core::SwapCoordinator> coordinator, std::shared_ptr<const util::Clock> clock, RefundMonitorOptions options);
  ~RefundMonitor();

  void Start();
  void Stop();

  // One sweep on the calling thread.
  SweepStats RunOnce();

 private:
  void Loop();

  std::shared_ptr<core::SwapCoordinator> coordinator_;
  std::shared_ptr<const util::Clock>     clock_;
  RefundMonitorOptions                   options_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace atomicswap::monitor
