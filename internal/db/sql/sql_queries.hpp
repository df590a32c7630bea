#pragma once

namespace atomicswap::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written with '?' placeholders; postgres statements go through
  ToPostgresPlaceholders(). Column order matches ReadSwap().
*/

#define ATOMICSWAP_SWAP_COLUMNS                                                                                                 \
  "id,status,initiator_asset,initiator_amount,acceptor_asset,acceptor_amount,initiator_address,acceptor_address,hashlock,"    \
  "secret,initiator_timelock,acceptor_timelock,initiator_txid,acceptor_txid,initiator_claim_txid,acceptor_claim_txid,"       \
  "initiator_refund_txid,acceptor_refund_txid,last_error,failed_at,created_at,accepted_at,completed_at,updated_at,version"

static constexpr const char* SWAP_COLUMNS = ATOMICSWAP_SWAP_COLUMNS;

static constexpr const char* INSERT_SWAP = "INSERT INTO swap_offer(" ATOMICSWAP_SWAP_COLUMNS
                                           ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SWAP = "SELECT " ATOMICSWAP_SWAP_COLUMNS " FROM swap_offer WHERE id=?;";

static constexpr const char* SELECT_SWAPS = "SELECT " ATOMICSWAP_SWAP_COLUMNS " FROM swap_offer";

static constexpr const char* ORDER_SWAPS = " ORDER BY created_at DESC, id DESC;";

static constexpr const char* SELECT_SWAP_VERSION = "SELECT version FROM swap_offer WHERE id=?;";

} // namespace atomicswap::db::sql
