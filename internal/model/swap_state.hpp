#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace atomicswap::model {

enum class SwapStatus : std::uint8_t {
  kUnspecified      = 0,
  kOffered          = 1,
  kAccepted         = 2,
  kInitiatorLocked  = 3,
  kAcceptorLocked   = 4,
  kInitiatorClaimed = 5,
  kCompleted        = 6,
  kRefunded         = 7,
  kCancelled        = 8,
};

enum class SwapAction : std::uint8_t {
  kCreate,
  kAccept,
  kLockInitiator,
  kLockAcceptor,
  kClaimInitiator,
  kClaimAcceptor,
  kRefundInitiator,
  kRefundAcceptor,
  kCancel,
};

struct Transition {
  SwapAction action;
  SwapStatus from;
  SwapStatus to;
};

/*
  Every legal state change. An action applied from a status not listed
  for it is an InvalidState error.

  REFUNDED -> REFUNDED is the one self-edge: once one leg is refunded the
  other leg may still be outstanding. Per-leg refund references on the
  record keep each leg from being refunded twice.
*/
inline constexpr std::array<Transition, 12> kTransitions = {{
    {SwapAction::kAccept, SwapStatus::kOffered, SwapStatus::kAccepted},
    {SwapAction::kLockInitiator, SwapStatus::kAccepted, SwapStatus::kInitiatorLocked},
    {SwapAction::kLockAcceptor, SwapStatus::kInitiatorLocked, SwapStatus::kAcceptorLocked},
    {SwapAction::kClaimInitiator, SwapStatus::kAcceptorLocked, SwapStatus::kInitiatorClaimed},
    {SwapAction::kClaimAcceptor, SwapStatus::kInitiatorClaimed, SwapStatus::kCompleted},

    {SwapAction::kRefundInitiator, SwapStatus::kInitiatorLocked, SwapStatus::kRefunded},
    {SwapAction::kRefundInitiator, SwapStatus::kAcceptorLocked, SwapStatus::kRefunded},
    {SwapAction::kRefundInitiator, SwapStatus::kInitiatorClaimed, SwapStatus::kRefunded},
    {SwapAction::kRefundInitiator, SwapStatus::kRefunded, SwapStatus::kRefunded},

    {SwapAction::kRefundAcceptor, SwapStatus::kAcceptorLocked, SwapStatus::kRefunded},
    {SwapAction::kRefundAcceptor, SwapStatus::kRefunded, SwapStatus::kRefunded},

    {SwapAction::kCancel, SwapStatus::kOffered, SwapStatus::kCancelled},
}};

constexpr std::optional<SwapStatus> NextStatus(SwapAction action, SwapStatus from) {
  for (const auto& t : kTransitions) {
    if (t.action == action && t.from == from) {
      return t.to;
    }
  }
  return std::nullopt;
}

constexpr bool CanApply(SwapAction action, SwapStatus from) {
  return NextStatus(action, from).has_value();
}

constexpr bool IsTerminal(SwapStatus status) {
  return status == SwapStatus::kCompleted || status == SwapStatus::kRefunded || status == SwapStatus::kCancelled;
}

// In flight: accepted and not yet settled either way.
constexpr bool IsActive(SwapStatus status) {
  return status == SwapStatus::kAccepted || status == SwapStatus::kInitiatorLocked || status == SwapStatus::kAcceptorLocked ||
         status == SwapStatus::kInitiatorClaimed;
}

constexpr bool TransitionsMoveForward() {
  for (const auto& t : kTransitions) {
    const bool refund_self_edge = t.from == SwapStatus::kRefunded && t.to == SwapStatus::kRefunded;
    if (!refund_self_edge && static_cast<std::uint8_t>(t.to) <= static_cast<std::uint8_t>(t.from)) {
      return false;
    }
    if (t.to == SwapStatus::kUnspecified || t.from == SwapStatus::kUnspecified) {
      return false;
    }
  }
  return true;
}

static_assert(TransitionsMoveForward(), "swap transitions must not form cycles");

constexpr std::string_view ToString(SwapStatus status) {
  switch (status) {
    case SwapStatus::kOffered:
      return "offered";
    case SwapStatus::kAccepted:
      return "accepted";
    case SwapStatus::kInitiatorLocked:
      return "initiator_locked";
    case SwapStatus::kAcceptorLocked:
      return "acceptor_locked";
    case SwapStatus::kInitiatorClaimed:
      return "initiator_claimed";
    case SwapStatus::kCompleted:
      return "completed";
    case SwapStatus::kRefunded:
      return "refunded";
    case SwapStatus::kCancelled:
      return "cancelled";
    case SwapStatus::kUnspecified:
    default:
      return "unspecified";
  }
}

constexpr std::optional<SwapStatus> ParseSwapStatus(std::string_view name) {
  for (auto status : {SwapStatus::kOffered, SwapStatus::kAccepted, SwapStatus::kInitiatorLocked, SwapStatus::kAcceptorLocked,
                      SwapStatus::kInitiatorClaimed, SwapStatus::kCompleted, SwapStatus::kRefunded, SwapStatus::kCancelled}) {
    if (ToString(status) == name) {
      return status;
    }
  }
  return std::nullopt;
}

constexpr std::string_view ToString(SwapAction action) {
  switch (action) {
    case SwapAction::kCreate:
      return "create";
    case SwapAction::kAccept:
      return "accept";
    case SwapAction::kLockInitiator:
      return "lock_initiator";
    case SwapAction::kLockAcceptor:
      return "lock_acceptor";
    case SwapAction::kClaimInitiator:
      return "claim_initiator";
    case SwapAction::kClaimAcceptor:
      return "claim_acceptor";
    case SwapAction::kRefundInitiator:
      return "refund_initiator";
    case SwapAction::kRefundAcceptor:
      return "refund_acceptor";
    case SwapAction::kCancel:
      return "cancel";
  }
  return "unknown";
}

} // namespace atomicswap::model
