#include "swap_sql.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"

namespace atomicswap::db::sql {

using atomicswap::model::Amount;
using atomicswap::model::SwapStatus;

namespace {

Param Text(const std::optional<std::string>& v) {
  if (!v) return nullptr;
  return *v;
}

Param Seconds(util::TimePoint tp) {
  return util::ToUnixSeconds(tp);
}

Param Seconds(const std::optional<util::TimePoint>& tp) {
  if (!tp) return nullptr;
  return util::ToUnixSeconds(*tp);
}

std::optional<std::string> OptText(const Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  return row.GetText(col);
}

std::optional<util::TimePoint> OptTime(const Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  return util::FromUnixSeconds(row.GetInt64(col));
}

void Set(Statement& st, const char* column, Param value) {
  if (!st.params.empty()) st.sql += ",";
  st.sql += column;
  st.sql += "=?";
  st.params.push_back(std::move(value));
}

} // namespace

Params InsertParams(const model::SwapRecord& r) {
  return {
      r.id,
      std::string(atomicswap::model::ToString(r.status)),
      r.initiator_asset,
      r.initiator_amount.ToString(),
      r.acceptor_asset,
      r.acceptor_amount.ToString(),
      r.initiator_address,
      Text(r.acceptor_address),
      r.hashlock,
      r.secret,
      Seconds(r.initiator_timelock),
      Seconds(r.acceptor_timelock),
      Text(r.initiator_txid),
      Text(r.acceptor_txid),
      Text(r.initiator_claim_txid),
      Text(r.acceptor_claim_txid),
      Text(r.initiator_refund_txid),
      Text(r.acceptor_refund_txid),
      Text(r.last_error),
      Seconds(r.failed_at),
      Seconds(r.created_at),
      Seconds(r.accepted_at),
      Seconds(r.completed_at),
      Seconds(r.updated_at),
      static_cast<std::int64_t>(r.version),
  };
}

model::SwapRecord ReadSwap(const Row& row) {
  model::SwapRecord r;
  r.id = row.GetText(0);

  auto status = atomicswap::model::ParseSwapStatus(row.GetText(1));
  if (!status) {
    throw std::runtime_error("swap " + r.id + " has unknown status '" + row.GetText(1) + "'");
  }
  r.status = *status;

  r.initiator_asset       = row.GetText(2);
  r.initiator_amount      = Amount::Parse(row.GetText(3));
  r.acceptor_asset        = row.GetText(4);
  r.acceptor_amount       = Amount::Parse(row.GetText(5));
  r.initiator_address     = row.GetText(6);
  r.acceptor_address      = OptText(row, 7);
  r.hashlock              = row.GetText(8);
  r.secret                = row.GetText(9);
  r.initiator_timelock    = util::FromUnixSeconds(row.GetInt64(10));
  r.acceptor_timelock     = util::FromUnixSeconds(row.GetInt64(11));
  r.initiator_txid        = OptText(row, 12);
  r.acceptor_txid         = OptText(row, 13);
  r.initiator_claim_txid  = OptText(row, 14);
  r.acceptor_claim_txid   = OptText(row, 15);
  r.initiator_refund_txid = OptText(row, 16);
  r.acceptor_refund_txid  = OptText(row, 17);
  r.last_error            = OptText(row, 18);
  r.failed_at             = OptTime(row, 19);
  r.created_at            = util::FromUnixSeconds(row.GetInt64(20));
  r.accepted_at           = OptTime(row, 21);
  r.completed_at          = OptTime(row, 22);
  r.updated_at            = util::FromUnixSeconds(row.GetInt64(23));
  r.version               = row.GetU64(24);
  return r;
}

Statement BuildList(const SwapFilter& filter) {
  Statement st;
  st.sql = SELECT_SWAPS;
  if (!filter.statuses.empty()) {
    st.sql += " WHERE status IN (";
    for (std::size_t i = 0; i < filter.statuses.size(); ++i) {
      st.sql += i == 0 ? "?" : ",?";
      st.params.push_back(std::string(atomicswap::model::ToString(filter.statuses[i])));
    }
    st.sql += ")";
  }
  st.sql += ORDER_SWAPS;
  return st;
}

Statement BuildUpdate(const std::string& id, const model::SwapUpdate& u) {
  Statement set;
  if (u.status) Set(set, "status", std::string(atomicswap::model::ToString(*u.status)));
  if (u.acceptor_address) Set(set, "acceptor_address", *u.acceptor_address);
  if (u.initiator_txid) Set(set, "initiator_txid", *u.initiator_txid);
  if (u.acceptor_txid) Set(set, "acceptor_txid", *u.acceptor_txid);
  if (u.initiator_claim_txid) Set(set, "initiator_claim_txid", *u.initiator_claim_txid);
  if (u.acceptor_claim_txid) Set(set, "acceptor_claim_txid", *u.acceptor_claim_txid);
  if (u.initiator_refund_txid) Set(set, "initiator_refund_txid", *u.initiator_refund_txid);
  if (u.acceptor_refund_txid) Set(set, "acceptor_refund_txid", *u.acceptor_refund_txid);
  if (u.last_error) Set(set, "last_error", Text(*u.last_error));
  if (u.failed_at) Set(set, "failed_at", Seconds(*u.failed_at));
  if (u.accepted_at) Set(set, "accepted_at", Seconds(*u.accepted_at));
  if (u.completed_at) Set(set, "completed_at", Seconds(*u.completed_at));
  Set(set, "updated_at", Seconds(u.updated_at));

  Statement st;
  st.sql    = "UPDATE swap_offer SET " + set.sql + ",version=version+1 WHERE id=? AND version=?;";
  st.params = std::move(set.params);
  st.params.push_back(id);
  st.params.push_back(static_cast<std::int64_t>(u.expected_version));
  return st;
}

std::string ToPostgresPlaceholders(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 16);
  int n = 0;
  for (char c : sql) {
    if (c == '?') {
      out += "$" + std::to_string(++n);
    } else {
      out += c;
    }
  }
  return out;
}

} // namespace atomicswap::db::sql
