#include "internal/core/swap_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "coordinator_fixture.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace atomicswap;
using model::SwapStatus;
using testing::CoordinatorFixture;

template <typename Fn>
void Race(int threads, Fn&& fn, std::atomic<int>& ok, std::atomic<int>& rejected) {
  std::atomic<bool>        go{false};
  std::vector<std::thread> workers;
  workers.reserve(threads);
  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      try {
        fn();
        ++ok;
      } catch (const util::InvalidState&) {
        ++rejected;
      }
    });
  }
  go = true;
  for (auto& t : workers) {
    t.join();
  }
}

void TestConcurrentInitiatorLocksSpendOnce() {
  CoordinatorFixture f;
  const auto         accepted = f.SwapAt(1);

  std::atomic<int> ok{0};
  std::atomic<int> rejected{0};
  Race(8, [&] { f.coordinator->LockInitiatorFunds(accepted.id); }, ok, rejected);

  assert(ok == 1);
  assert(rejected == 7);
  assert(f.btc->Balance() == model::Amount::Parse("9"));
  assert(f.coordinator->GetSwap(accepted.id).status == SwapStatus::kInitiatorLocked);
}

void TestConcurrentAcceptsHaveOneWinner() {
  CoordinatorFixture f;
  const auto         offered = f.SwapAt(0);

  std::atomic<int> ok{0};
  std::atomic<int> rejected{0};
  Race(8, [&] { f.coordinator->AcceptOffer(offered.id, "btc-addr-bob"); }, ok, rejected);

  assert(ok == 1);
  assert(rejected == 7);
  assert(f.coordinator->GetSwap(offered.id).version == offered.version + 1);
}

void TestIndependentSwapsProceedInParallel() {
  CoordinatorFixture f;
  std::vector<std::string> ids;
  for (int i = 0; i < 6; ++i) {
    ids.push_back(f.SwapAt(1).id);
  }

  std::vector<std::thread> workers;
  for (const auto& id : ids) {
    workers.emplace_back([&f, id] { f.coordinator->LockInitiatorFunds(id); });
  }
  for (auto& t : workers) {
    t.join();
  }

  for (const auto& id : ids) {
    assert(f.coordinator->GetSwap(id).status == SwapStatus::kInitiatorLocked);
  }
  assert(f.btc->Balance() == model::Amount::Parse("4"));
}

// A second coordinator on the same store has its own per-swap mutexes;
// the version check still admits only one writer.
void TestCompareAndSetAcrossCoordinators() {
  CoordinatorFixture    f;
  core::SwapCoordinator other(settlement::BackendMap{{"btc", f.btc}, {"depix", f.depix}}, f.repository, f.clock, f.coordinator->Policy());
  const auto            offered = f.SwapAt(0);

  std::atomic<int> ok{0};
  std::atomic<int> rejected{0};
  Race(
      8,
      [&] {
        static std::atomic<int> turn{0};
        if (turn++ % 2 == 0) {
          f.coordinator->CancelOffer(offered.id);
        } else {
          other.CancelOffer(offered.id);
        }
      },
      ok, rejected);

  assert(ok == 1);
  assert(rejected == 7);
  assert(f.coordinator->GetSwap(offered.id).status == SwapStatus::kCancelled);
}

} // namespace

int main() {
  TestConcurrentInitiatorLocksSpendOnce();
  TestConcurrentAcceptsHaveOneWinner();
  TestIndependentSwapsProceedInParallel();
  TestCompareAndSetAcrossCoordinators();

  std::cout << "atomicswap_unit_swap_coordinator_concurrency: pass\n";
  return 0;
}
