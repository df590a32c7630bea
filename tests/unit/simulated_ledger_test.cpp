#include "internal/settlement/simulated/simulated_ledger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/htlc/commitment.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace atomicswap;
using settlement::LockRequest;
using settlement::simulated::SimulatedLedger;

struct Fixture {
  std::shared_ptr<util::ManualClock> clock = std::make_shared<util::ManualClock>(util::FromUnixSeconds(1'700'000'000));
  SimulatedLedger                    ledger{"btc", model::Amount::Parse("10"), clock};
  htlc::Secret                       secret   = htlc::GenerateSecret();
  std::string                        hashlock = htlc::Hashlock(secret);

  LockRequest Request(const char* amount) const {
    return {model::Amount::Parse(amount), hashlock, htlc::MakeTimelock(*clock, std::chrono::hours(1)), "bob"};
  }
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestLockDebitsAndRedeemCredits() {
  Fixture f;
  const auto ref = f.ledger.Lock(f.Request("4"));
  assert(f.ledger.Balance() == model::Amount::Parse("6"));

  const auto redeem = f.ledger.Redeem(ref, htlc::SecretToHex(f.secret));
  assert(!redeem.empty());
  assert(f.ledger.CreditedTo("bob") == model::Amount::Parse("4"));
  assert(f.ledger.RevealedSecret(ref) == htlc::SecretToHex(f.secret));
  assert(f.ledger.GetLock(ref)->state == SimulatedLedger::LockState::kRedeemed);

  // settles once
  assert(Throws<util::BackendRejected>([&] { f.ledger.Redeem(ref, htlc::SecretToHex(f.secret)); }));
  assert(Throws<util::BackendRejected>([&] { f.ledger.Refund(ref); }));
}

void TestLockRejectsInsufficientFunds() {
  Fixture f;
  assert(Throws<util::BackendRejected>([&] { f.ledger.Lock(f.Request("10.00000001")); }));
  assert(f.ledger.Balance() == model::Amount::Parse("10"));
}

void TestRedeemRejectsWrongSecretAndExpiry() {
  Fixture f;
  const auto ref = f.ledger.Lock(f.Request("1"));

  const auto wrong = htlc::GenerateSecret();
  assert(Throws<util::BackendRejected>([&] { f.ledger.Redeem(ref, htlc::SecretToHex(wrong)); }));
  assert(Throws<util::BackendRejected>([&] { f.ledger.Redeem(ref, "not-hex"); }));
  assert(!f.ledger.RevealedSecret(ref).has_value());

  f.clock->Advance(std::chrono::hours(1) + std::chrono::seconds(1));
  assert(Throws<util::BackendRejected>([&] { f.ledger.Redeem(ref, htlc::SecretToHex(f.secret)); }));
}

void TestRefundOnlyAfterExpiry() {
  Fixture f;
  const auto ref = f.ledger.Lock(f.Request("3"));

  assert(Throws<util::BackendRejected>([&] { f.ledger.Refund(ref); }));

  f.clock->Advance(std::chrono::hours(1) + std::chrono::seconds(1));
  assert(!f.ledger.Refund(ref).empty());
  assert(f.ledger.Balance() == model::Amount::Parse("10"));
  assert(Throws<util::BackendRejected>([&] { f.ledger.Refund(ref); }));
  assert(Throws<util::BackendRejected>([&] { f.ledger.Refund("btc-lock-unknown"); }));
}

void TestFaultInjection() {
  Fixture f;
  f.ledger.SetAvailable(false);
  assert(Throws<util::BackendUnavailable>([&] { f.ledger.Lock(f.Request("1")); }));
  assert(Throws<util::BackendUnavailable>([&] { (void)f.ledger.Balance(); }));
  f.ledger.SetAvailable(true);
  assert(f.ledger.Balance() == model::Amount::Parse("10"));

  f.ledger.FailNextCalls(2);
  assert(Throws<util::BackendUnavailable>([&] { (void)f.ledger.Balance(); }));
  assert(Throws<util::BackendUnavailable>([&] { (void)f.ledger.Balance(); }));
  assert(f.ledger.Balance() == model::Amount::Parse("10"));
}

} // namespace

int main() {
  TestLockDebitsAndRedeemCredits();
  TestLockRejectsInsufficientFunds();
  TestRedeemRejectsWrongSecretAndExpiry();
  TestRefundOnlyAfterExpiry();
  TestFaultInjection();

  std::cout << "atomicswap_unit_simulated_ledger: pass\n";
  return 0;
}
