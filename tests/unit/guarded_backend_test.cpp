#include "internal/settlement/guarded_backend.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "internal/htlc/commitment.hpp"
#include "internal/settlement/simulated/simulated_ledger.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace atomicswap;
using namespace std::chrono_literals;
using settlement::CallPolicy;
using settlement::GuardedBackend;
using settlement::simulated::SimulatedLedger;

// Counts calls reaching the wrapped backend.
class CountingBackend final : public settlement::SettlementBackend {
 public:
  explicit CountingBackend(std::shared_ptr<SimulatedLedger> inner) : inner_(std::move(inner)) {
  }

  const std::string& Asset() const override {
    return inner_->Asset();
  }
  std::string Lock(const settlement::LockRequest& request) override {
    ++calls;
    return inner_->Lock(request);
  }
  std::string Redeem(const std::string& ref, const std::string& secret) override {
    ++calls;
    return inner_->Redeem(ref, secret);
  }
  std::string Refund(const std::string& ref) override {
    ++calls;
    return inner_->Refund(ref);
  }
  model::Amount Balance() override {
    ++calls;
    return inner_->Balance();
  }

  std::atomic<int> calls{0};

 private:
  std::shared_ptr<SimulatedLedger> inner_;
};

struct Fixture {
  std::shared_ptr<util::ManualClock> clock  = std::make_shared<util::ManualClock>(util::FromUnixSeconds(1'700'000'000));
  std::shared_ptr<SimulatedLedger>   ledger = std::make_shared<SimulatedLedger>("depix", model::Amount::Parse("100"), clock);
  std::shared_ptr<CountingBackend>   counting = std::make_shared<CountingBackend>(ledger);

  GuardedBackend Guard(CallPolicy policy) {
    return GuardedBackend(counting, policy);
  }

  settlement::LockRequest Request(const char* amount) const {
    return {model::Amount::Parse(amount), htlc::Hashlock(htlc::GenerateSecret()), htlc::MakeTimelock(*clock, 1h), "alice"};
  }
};

CallPolicy FastPolicy(std::uint32_t attempts) {
  CallPolicy policy;
  policy.call_timeout    = 2s;
  policy.max_attempts    = attempts;
  policy.initial_backoff = 1ms;
  policy.max_backoff     = 4ms;
  return policy;
}

void TestTransientFailuresAreRetried() {
  Fixture f;
  auto    guarded = f.Guard(FastPolicy(3));

  f.ledger->FailNextCalls(2);
  const auto ref = guarded.Lock(f.Request("1"));
  assert(!ref.empty());
  assert(f.counting->calls == 3);
  assert(f.ledger->Balance() == model::Amount::Parse("99"));
}

void TestRetriesAreBounded() {
  Fixture f;
  auto    guarded = f.Guard(FastPolicy(2));

  f.ledger->SetAvailable(false);
  bool threw = false;
  try {
    (void)guarded.Balance();
  } catch (const util::BackendUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(f.counting->calls == 2);
}

void TestRejectionIsNeverRetried() {
  Fixture f;
  auto    guarded = f.Guard(FastPolicy(5));

  bool threw = false;
  try {
    (void)guarded.Lock(f.Request("1000"));
  } catch (const util::BackendRejected&) {
    threw = true;
  }
  assert(threw);
  assert(f.counting->calls == 1);
}

void TestTimeoutSurfacesAsUnavailableWithoutResubmittingLocks() {
  Fixture f;
  CallPolicy policy   = FastPolicy(3);
  policy.call_timeout = 20ms;
  auto guarded        = f.Guard(policy);

  f.ledger->SetLatency(200ms);
  bool threw = false;
  try {
    (void)guarded.Lock(f.Request("1"));
  } catch (const util::BackendUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(f.counting->calls == 1);

  // let the abandoned call drain before the fixture goes away
  std::this_thread::sleep_for(300ms);
}

void TestAbandonedCallsAreBounded() {
  Fixture f;
  CallPolicy policy          = FastPolicy(2);
  policy.call_timeout        = 50ms;
  policy.max_abandoned_calls = 2;
  auto guarded               = f.Guard(policy);

  f.ledger->SetLatency(300ms);
  for (int i = 0; i < 2; ++i) {
    bool threw = false;
    try {
      (void)guarded.Lock(f.Request("1"));
    } catch (const util::BackendUnavailable&) {
      threw = true;
    }
    assert(threw);
  }
  assert(f.counting->calls == 2);
  assert(guarded.AbandonedCalls() == 2);

  // Both retries fail fast without reaching the ledger.
  bool threw = false;
  try {
    (void)guarded.Lock(f.Request("1"));
  } catch (const util::BackendUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(f.counting->calls == 2);

  f.ledger->SetLatency(0ms);
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (guarded.AbandonedCalls() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(20ms);
  }
  assert(guarded.AbandonedCalls() == 0);

  (void)guarded.Lock(f.Request("1"));
  assert(f.counting->calls == 3);
}

void TestBackoffIsCapped() {
  Fixture f;
  CallPolicy policy      = FastPolicy(4);
  policy.initial_backoff = 10ms;
  policy.max_backoff     = 10ms;
  auto guarded           = f.Guard(policy);

  f.ledger->FailNextCalls(3);
  const auto started = std::chrono::steady_clock::now();
  assert(guarded.Balance() == model::Amount::Parse("100"));
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed >= 30ms);
  assert(elapsed < 1s);
}

} // namespace

int main() {
  TestTransientFailuresAreRetried();
  TestRetriesAreBounded();
  TestRejectionIsNeverRetried();
  TestTimeoutSurfacesAsUnavailableWithoutResubmittingLocks();
  TestAbandonedCallsAreBounded();
  TestBackoffIsCapped();

  std::cout << "atomicswap_unit_guarded_backend: pass\n";
  return 0;
}
