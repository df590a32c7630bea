#include "swap_mapper.hpp"

#include "internal/util/time.hpp"

namespace atomicswap::service {

namespace v1 = atomicswap::coordinator::v1;
using atomicswap::model::SwapStatus;

v1::SwapStatus ToProto(SwapStatus status) {
  switch (status) {
    case SwapStatus::kOffered:
      return v1::SWAP_STATUS_OFFERED;
    case SwapStatus::kAccepted:
      return v1::SWAP_STATUS_ACCEPTED;
    case SwapStatus::kInitiatorLocked:
      return v1::SWAP_STATUS_INITIATOR_LOCKED;
    case SwapStatus::kAcceptorLocked:
      return v1::SWAP_STATUS_ACCEPTOR_LOCKED;
    case SwapStatus::kInitiatorClaimed:
      return v1::SWAP_STATUS_INITIATOR_CLAIMED;
    case SwapStatus::kCompleted:
      return v1::SWAP_STATUS_COMPLETED;
    case SwapStatus::kRefunded:
      return v1::SWAP_STATUS_REFUNDED;
    case SwapStatus::kCancelled:
      return v1::SWAP_STATUS_CANCELLED;
    case SwapStatus::kUnspecified:
    default:
      return v1::SWAP_STATUS_UNSPECIFIED;
  }
}

SwapStatus FromProto(v1::SwapStatus status) {
  switch (status) {
    case v1::SWAP_STATUS_OFFERED:
      return SwapStatus::kOffered;
    case v1::SWAP_STATUS_ACCEPTED:
      return SwapStatus::kAccepted;
    case v1::SWAP_STATUS_INITIATOR_LOCKED:
      return SwapStatus::kInitiatorLocked;
    case v1::SWAP_STATUS_ACCEPTOR_LOCKED:
      return SwapStatus::kAcceptorLocked;
    case v1::SWAP_STATUS_INITIATOR_CLAIMED:
      return SwapStatus::kInitiatorClaimed;
    case v1::SWAP_STATUS_COMPLETED:
      return SwapStatus::kCompleted;
    case v1::SWAP_STATUS_REFUNDED:
      return SwapStatus::kRefunded;
    case v1::SWAP_STATUS_CANCELLED:
      return SwapStatus::kCancelled;
    default:
      return SwapStatus::kUnspecified;
  }
}

v1::SwapOffer ToProto(const db::model::SwapRecord& swap) {
  v1::SwapOffer offer;
  offer.set_id(swap.id);
  offer.set_status(ToProto(swap.status));

  offer.set_initiator_asset(swap.initiator_asset);
  offer.set_initiator_amount(swap.initiator_amount.ToString());
  offer.set_acceptor_asset(swap.acceptor_asset);
  offer.set_acceptor_amount(swap.acceptor_amount.ToString());

  offer.set_initiator_address(swap.initiator_address);
  if (swap.acceptor_address) offer.set_acceptor_address(*swap.acceptor_address);

  offer.set_hashlock(swap.hashlock);
  *offer.mutable_initiator_timelock() = util::ToProto(swap.initiator_timelock);
  *offer.mutable_acceptor_timelock()  = util::ToProto(swap.acceptor_timelock);

  if (swap.initiator_txid) offer.set_initiator_txid(*swap.initiator_txid);
  if (swap.acceptor_txid) offer.set_acceptor_txid(*swap.acceptor_txid);
  if (swap.initiator_claim_txid) offer.set_initiator_claim_txid(*swap.initiator_claim_txid);
  if (swap.acceptor_claim_txid) offer.set_acceptor_claim_txid(*swap.acceptor_claim_txid);
  if (swap.initiator_refund_txid) offer.set_initiator_refund_txid(*swap.initiator_refund_txid);
  if (swap.acceptor_refund_txid) offer.set_acceptor_refund_txid(*swap.acceptor_refund_txid);

  if (swap.last_error) offer.set_last_error(*swap.last_error);
  if (swap.failed_at) *offer.mutable_failed_at() = util::ToProto(*swap.failed_at);

  *offer.mutable_created_at() = util::ToProto(swap.created_at);
  if (swap.accepted_at) *offer.mutable_accepted_at() = util::ToProto(*swap.accepted_at);
  if (swap.completed_at) *offer.mutable_completed_at() = util::ToProto(*swap.completed_at);
  *offer.mutable_updated_at() = util::ToProto(swap.updated_at);

  offer.set_version(swap.version);
  return offer;
}

} // namespace atomicswap::service
