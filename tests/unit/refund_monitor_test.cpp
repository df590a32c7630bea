#include "internal/monitor/refund_monitor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "coordinator_fixture.hpp"

namespace {

using namespace atomicswap;
using namespace std::chrono_literals;
using model::SwapStatus;
using monitor::RefundMonitor;
using monitor::RefundMonitorOptions;
using testing::CoordinatorFixture;

void TestNothingToDoBeforeExpiry() {
  CoordinatorFixture f;
  f.SwapAt(3);

  RefundMonitor monitor(f.coordinator, f.clock, {});
  const auto    stats = monitor.RunOnce();
  assert(stats.refunded == 0 && stats.failed == 0 && stats.skipped == 0);
}

void TestRefundsLegsAsTheyExpire() {
  CoordinatorFixture f;
  const auto         locked  = f.SwapAt(3);
  const auto         partial = f.SwapAt(2);
  const auto         done    = f.SwapAt(4);
  f.coordinator->ClaimAcceptor(done.id, std::nullopt);

  RefundMonitor monitor(f.coordinator, f.clock, {});

  f.clock->Advance(12h + 1s);
  auto stats = monitor.RunOnce();
  assert(stats.refunded == 1);
  auto swap = f.coordinator->GetSwap(locked.id);
  assert(swap.status == SwapStatus::kRefunded);
  assert(swap.acceptor_refund_txid.has_value());
  assert(!swap.initiator_refund_txid.has_value());
  assert(f.coordinator->GetSwap(partial.id).status == SwapStatus::kInitiatorLocked);

  f.clock->Advance(12h);
  stats = monitor.RunOnce();
  assert(stats.refunded == 2);
  assert(f.coordinator->GetSwap(locked.id).initiator_refund_txid.has_value());
  assert(f.coordinator->GetSwap(partial.id).status == SwapStatus::kRefunded);
  assert(f.coordinator->GetSwap(done.id).status == SwapStatus::kCompleted);
  assert(f.btc->Balance() == model::Amount::Parse("9"));
  assert(f.depix->Balance() == model::Amount::Parse("650000"));

  stats = monitor.RunOnce();
  assert(stats.refunded == 0);
}

void TestBackendFailureIsCountedAndRetried() {
  CoordinatorFixture f;
  const auto         locked = f.SwapAt(2);

  RefundMonitor monitor(f.coordinator, f.clock, {});
  f.clock->Advance(24h + 1s);

  f.btc->SetAvailable(false);
  auto stats = monitor.RunOnce();
  assert(stats.failed == 1);
  assert(stats.refunded == 0);
  assert(f.coordinator->GetSwap(locked.id).status == SwapStatus::kInitiatorLocked);

  f.btc->SetAvailable(true);
  stats = monitor.RunOnce();
  assert(stats.refunded == 1);
  assert(f.coordinator->GetSwap(locked.id).status == SwapStatus::kRefunded);
}

void TestCancelsExpiredOffersWhenEnabled() {
  CoordinatorFixture f;
  const auto         stale = f.SwapAt(0);

  RefundMonitor keep(f.coordinator, f.clock, {30000ms, false});
  RefundMonitor sweep(f.coordinator, f.clock, {30000ms, true});

  f.clock->Advance(12h + 1s);
  const auto fresh = f.SwapAt(0);

  assert(keep.RunOnce().cancelled == 0);
  assert(f.coordinator->GetSwap(stale.id).status == SwapStatus::kOffered);

  assert(sweep.RunOnce().cancelled == 1);
  assert(f.coordinator->GetSwap(stale.id).status == SwapStatus::kCancelled);
  assert(f.coordinator->GetSwap(fresh.id).status == SwapStatus::kOffered);
}

void TestBackgroundLoop() {
  CoordinatorFixture f;
  const auto         locked = f.SwapAt(2);
  f.clock->Advance(24h + 1s);

  RefundMonitor monitor(f.coordinator, f.clock, {10ms, false});
  monitor.Start();
  for (int i = 0; i < 200 && f.coordinator->GetSwap(locked.id).status != SwapStatus::kRefunded; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  monitor.Stop();
  monitor.Stop();
  assert(f.coordinator->GetSwap(locked.id).status == SwapStatus::kRefunded);
}

void TestRejectsBadOptions() {
  CoordinatorFixture f;
  bool               threw = false;
  try {
    RefundMonitor monitor(f.coordinator, f.clock, {0ms, false});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNothingToDoBeforeExpiry();
  TestRefundsLegsAsTheyExpire();
  TestBackendFailureIsCountedAndRetried();
  TestCancelsExpiredOffersWhenEnabled();
  TestBackgroundLoop();
  TestRejectsBadOptions();

  std::cout << "atomicswap_unit_refund_monitor: pass\n";
  return 0;
}
