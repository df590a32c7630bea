#include "internal/model/swap_state.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace atomicswap::model;

static_assert(NextStatus(SwapAction::kAccept, SwapStatus::kOffered) == SwapStatus::kAccepted);
static_assert(!CanApply(SwapAction::kAccept, SwapStatus::kAccepted));
static_assert(!CanApply(SwapAction::kCreate, SwapStatus::kOffered));

void TestHappyPathChain() {
  auto status = SwapStatus::kOffered;
  for (auto action : {SwapAction::kAccept, SwapAction::kLockInitiator, SwapAction::kLockAcceptor, SwapAction::kClaimInitiator,
                      SwapAction::kClaimAcceptor}) {
    const auto next = NextStatus(action, status);
    assert(next.has_value());
    status = *next;
  }
  assert(status == SwapStatus::kCompleted);
  assert(IsTerminal(status));
}

void TestLockOrderIsEnforced() {
  assert(!CanApply(SwapAction::kLockAcceptor, SwapStatus::kAccepted));
  assert(!CanApply(SwapAction::kClaimInitiator, SwapStatus::kInitiatorLocked));
  assert(!CanApply(SwapAction::kClaimAcceptor, SwapStatus::kAcceptorLocked));
}

void TestRefundSources() {
  for (auto from : {SwapStatus::kInitiatorLocked, SwapStatus::kAcceptorLocked, SwapStatus::kInitiatorClaimed, SwapStatus::kRefunded}) {
    assert(NextStatus(SwapAction::kRefundInitiator, from) == SwapStatus::kRefunded);
  }
  for (auto from : {SwapStatus::kOffered, SwapStatus::kAccepted, SwapStatus::kCompleted, SwapStatus::kCancelled}) {
    assert(!CanApply(SwapAction::kRefundInitiator, from));
  }

  assert(CanApply(SwapAction::kRefundAcceptor, SwapStatus::kAcceptorLocked));
  assert(CanApply(SwapAction::kRefundAcceptor, SwapStatus::kRefunded));
  assert(!CanApply(SwapAction::kRefundAcceptor, SwapStatus::kInitiatorLocked));
  assert(!CanApply(SwapAction::kRefundAcceptor, SwapStatus::kInitiatorClaimed));
}

void TestCancelOnlyBeforeAcceptance() {
  assert(CanApply(SwapAction::kCancel, SwapStatus::kOffered));
  assert(!CanApply(SwapAction::kCancel, SwapStatus::kAccepted));
  assert(!CanApply(SwapAction::kCancel, SwapStatus::kInitiatorLocked));
}

void TestTerminalStatesOnlyEscapeThroughRefund() {
  for (const auto& t : kTransitions) {
    if (t.from == SwapStatus::kCompleted || t.from == SwapStatus::kCancelled) {
      assert(false && "completed and cancelled swaps must have no outgoing transitions");
    }
    if (t.from == SwapStatus::kRefunded) {
      assert(t.to == SwapStatus::kRefunded);
    }
  }
}

void TestStatusNames() {
  assert(ToString(SwapStatus::kInitiatorLocked) == "initiator_locked");
  assert(ParseSwapStatus("acceptor_locked") == SwapStatus::kAcceptorLocked);
  assert(!ParseSwapStatus("unspecified").has_value());
  assert(!ParseSwapStatus("bogus").has_value());
  assert(IsActive(SwapStatus::kInitiatorClaimed));
  assert(!IsActive(SwapStatus::kOffered));
}

} // namespace

int main() {
  TestHappyPathChain();
  TestLockOrderIsEnforced();
  TestRefundSources();
  TestCancelOnlyBeforeAcceptance();
  TestTerminalStatesOnlyEscapeThroughRefund();
  TestStatusNames();

  std::cout << "atomicswap_unit_swap_state: pass\n";
  return 0;
}
