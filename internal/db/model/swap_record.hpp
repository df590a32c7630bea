#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/amount.hpp"
#include "internal/model/swap_state.hpp"
#include "internal/util/clock.hpp"

namespace atomicswap::db::model {

/*
  Persistent swap row.

  IMPORTANT:
  - hashlock, secret, amounts and both timelocks never change after insert.
  - secret is the hex pre-image of hashlock. Nothing above the service
    layer may put it on the wire except the initiator claim response.
  - version is the compare-and-set token for UpdateSwap.
*/

struct SwapRecord {
  std::string id; // UUID v4, canonical text

  atomicswap::model::SwapStatus status = atomicswap::model::SwapStatus::kOffered;

  std::string               initiator_asset;
  atomicswap::model::Amount initiator_amount;
  std::string               acceptor_asset;
  atomicswap::model::Amount acceptor_amount;

  // initiator receives on the acceptor's asset; acceptor on the initiator's
  std::string                initiator_address;
  std::optional<std::string> acceptor_address;

  std::string hashlock;
  std::string secret;

  util::TimePoint initiator_timelock{};
  util::TimePoint acceptor_timelock{};

  // Backend references
  std::optional<std::string> initiator_txid;
  std::optional<std::string> acceptor_txid;
  std::optional<std::string> initiator_claim_txid; // initiator redeemed acceptor_txid
  std::optional<std::string> acceptor_claim_txid;  // acceptor redeemed initiator_txid
  std::optional<std::string> initiator_refund_txid;
  std::optional<std::string> acceptor_refund_txid;

  // Audit marker for a rejected second-leg lock
  std::optional<std::string>     last_error;
  std::optional<util::TimePoint> failed_at;

  util::TimePoint                created_at{};
  std::optional<util::TimePoint> accepted_at;
  std::optional<util::TimePoint> completed_at;
  util::TimePoint                updated_at{};

  std::uint64_t version = 1;
};

/*
  Partial update. Unset fields are left alone.

  The optional<optional<>> marker fields allow clearing: an engaged outer
  optional holding nullopt writes NULL.
*/
struct SwapUpdate {
  std::uint64_t expected_version = 0;

  std::optional<atomicswap::model::SwapStatus> status;

  std::optional<std::string> acceptor_address;
  std::optional<std::string> initiator_txid;
  std::optional<std::string> acceptor_txid;
  std::optional<std::string> initiator_claim_txid;
  std::optional<std::string> acceptor_claim_txid;
  std::optional<std::string> initiator_refund_txid;
  std::optional<std::string> acceptor_refund_txid;

  std::optional<std::optional<std::string>>     last_error;
  std::optional<std::optional<util::TimePoint>> failed_at;

  std::optional<util::TimePoint> accepted_at;
  std::optional<util::TimePoint> completed_at;

  util::TimePoint updated_at{};
};

// Applies update to record in place and bumps the version.
inline void Apply(SwapRecord& record, const SwapUpdate& update) {
  if (update.status) record.status = *update.status;
  if (update.acceptor_address) record.acceptor_address = update.acceptor_address;
  if (update.initiator_txid) record.initiator_txid = update.initiator_txid;
  if (update.acceptor_txid) record.acceptor_txid = update.acceptor_txid;
  if (update.initiator_claim_txid) record.initiator_claim_txid = update.initiator_claim_txid;
  if (update.acceptor_claim_txid) record.acceptor_claim_txid = update.acceptor_claim_txid;
  if (update.initiator_refund_txid) record.initiator_refund_txid = update.initiator_refund_txid;
  if (update.acceptor_refund_txid) record.acceptor_refund_txid = update.acceptor_refund_txid;
  if (update.last_error) record.last_error = *update.last_error;
  if (update.failed_at) record.failed_at = *update.failed_at;
  if (update.accepted_at) record.accepted_at = update.accepted_at;
  if (update.completed_at) record.completed_at = update.completed_at;
  record.updated_at = update.updated_at;
  record.version += 1;
}

} // namespace atomicswap::db::model
