#include "internal/core/swap_coordinator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "coordinator_fixture.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace atomicswap;
using namespace std::chrono_literals;
using model::SwapStatus;
using testing::CoordinatorFixture;
using testing::Throws;

void TestRefundBothLegsAfterExpiry() {
  CoordinatorFixture f;
  const auto         locked = f.SwapAt(3);
  assert(f.btc->Balance() == model::Amount::Parse("9"));
  assert(f.depix->Balance() == model::Amount::Parse("650000"));

  assert(Throws<util::TimelockNotExpired>([&] { f.coordinator->RefundAcceptor(locked.id); }));
  assert(Throws<util::TimelockNotExpired>([&] { f.coordinator->RefundInitiator(locked.id); }));

  f.clock->Advance(12h + 1s);
  auto swap = f.coordinator->RefundAcceptor(locked.id);
  assert(swap.status == SwapStatus::kRefunded);
  assert(swap.acceptor_refund_txid.has_value());
  assert(f.depix->Balance() == model::Amount::Parse("1000000"));

  // initiator leg still inside its timelock
  assert(Throws<util::TimelockNotExpired>([&] { f.coordinator->RefundInitiator(locked.id); }));

  f.clock->Advance(12h);
  swap = f.coordinator->RefundInitiator(locked.id, true);
  assert(swap.status == SwapStatus::kRefunded);
  assert(swap.initiator_refund_txid.has_value());
  assert(f.btc->Balance() == model::Amount::Parse("10"));

  assert(Throws<util::InvalidState>([&] { f.coordinator->RefundInitiator(locked.id); }));
  assert(Throws<util::InvalidState>([&] { f.coordinator->RefundAcceptor(locked.id); }));
}

void TestInitiatorRefundBeforeAcceptorLock() {
  CoordinatorFixture f;
  const auto         locked = f.SwapAt(2);

  // acceptor never locked
  f.clock->Advance(24h + 1s);
  assert(Throws<util::InvalidState>([&] { f.coordinator->RefundAcceptor(locked.id); }));

  const auto swap = f.coordinator->RefundInitiator(locked.id);
  assert(swap.status == SwapStatus::kRefunded);
  assert(!swap.acceptor_refund_txid.has_value());
  assert(f.btc->Balance() == model::Amount::Parse("10"));
}

void TestInitiatorRefundAfterAcceptorFailsToClaim() {
  CoordinatorFixture f;
  const auto         claimed = f.SwapAt(4);

  // the acceptor's lock is already redeemed
  f.clock->Advance(24h + 1s);
  assert(Throws<util::InvalidState>([&] { f.coordinator->RefundAcceptor(claimed.id); }));
  assert(Throws<util::InvalidState>([&] { f.coordinator->ClaimAcceptor(claimed.id, std::nullopt); }));

  const auto swap = f.coordinator->RefundInitiator(claimed.id);
  assert(swap.status == SwapStatus::kRefunded);
  assert(swap.initiator_claim_txid.has_value());
  assert(swap.initiator_refund_txid.has_value());
}

void TestRefundsNotAllowedOutsideLockedStates() {
  CoordinatorFixture f;
  const auto         offered  = f.SwapAt(0);
  const auto         accepted = f.SwapAt(1);

  f.clock->Advance(48h);
  assert(Throws<util::InvalidState>([&] { f.coordinator->RefundInitiator(offered.id); }));
  assert(Throws<util::InvalidState>([&] { f.coordinator->RefundInitiator(accepted.id); }));
  assert(Throws<util::NotFound>([&] { f.coordinator->RefundAcceptor("missing"); }));

  auto completed = f.SwapAt(4);
  f.coordinator->ClaimAcceptor(completed.id, std::nullopt);
  f.clock->Advance(48h);
  assert(Throws<util::InvalidState>([&] { f.coordinator->RefundInitiator(completed.id); }));
}

void TestBackendRejectionLeavesRecordUntouched() {
  CoordinatorFixture f;
  const auto         locked = f.SwapAt(3);

  // refunded out of band directly on the ledger
  f.clock->Advance(12h + 1s);
  f.depix->Refund(*locked.acceptor_txid);

  assert(Throws<util::BackendRejected>([&] { f.coordinator->RefundAcceptor(locked.id); }));
  const auto stored = f.coordinator->GetSwap(locked.id);
  assert(stored.status == SwapStatus::kAcceptorLocked);
  assert(stored.version == locked.version);
}

} // namespace

int main() {
  TestRefundBothLegsAfterExpiry();
  TestInitiatorRefundBeforeAcceptorLock();
  TestInitiatorRefundAfterAcceptorFailsToClaim();
  TestRefundsNotAllowedOutsideLockedStates();
  TestBackendRejectionLeavesRecordUntouched();

  std::cout << "atomicswap_unit_swap_coordinator_refund: pass\n";
  return 0;
}
