#include "migrations.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace atomicswap::db::sql {
namespace {

// Column types that differ between the two stores.
struct Dialect {
  const char* amount;
  const char* instant;
};

constexpr Dialect kSqlite{"TEXT", "INTEGER"};
constexpr Dialect kPostgres{"NUMERIC(38,8)", "BIGINT"};

std::string SwapTable(const Dialect& d) {
  const std::string amount  = d.amount;
  const std::string instant = d.instant;
  return "CREATE TABLE IF NOT EXISTS swap_offer ("
         "id TEXT PRIMARY KEY, status TEXT NOT NULL, "
         "initiator_asset TEXT NOT NULL, initiator_amount " + amount + " NOT NULL, "
         "acceptor_asset TEXT NOT NULL, acceptor_amount " + amount + " NOT NULL, "
         "initiator_address TEXT NOT NULL, acceptor_address TEXT, "
         "hashlock TEXT NOT NULL, secret TEXT NOT NULL, "
         "initiator_timelock " + instant + " NOT NULL, acceptor_timelock " + instant + " NOT NULL, "
         "initiator_txid TEXT, acceptor_txid TEXT, initiator_claim_txid TEXT, acceptor_claim_txid TEXT, "
         "initiator_refund_txid TEXT, acceptor_refund_txid TEXT, "
         "last_error TEXT, failed_at " + instant + ", "
         "created_at " + instant + " NOT NULL, accepted_at " + instant + ", completed_at " + instant + ", "
         "updated_at " + instant + " NOT NULL, version " + instant + " NOT NULL, "
         "CHECK (acceptor_timelock < initiator_timelock));";
}

Schema Build(const Dialect& d) {
  return {
      {"swap_offer", SwapTable(d)},
      {"swap_offer_status_idx", "CREATE INDEX IF NOT EXISTS swap_offer_status_idx ON swap_offer(status);"},
      {"swap_offer_created_idx", "CREATE INDEX IF NOT EXISTS swap_offer_created_idx ON swap_offer(created_at);"},
  };
}

} // namespace

void RunMigrations(MigrationExecutor& executor, const Schema& schema) {
  for (const auto& step : schema) {
    try {
      executor.ExecuteSQL(step.sql);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration " + std::string(step.name) + " failed: " + e.what());
    }
  }
}

const Schema& SqliteSchema() {
  static const Schema schema = [] {
    auto steps = Build(kSqlite);
    // Fails on a pre-existing table whose columns do not match.
    steps.push_back({"swap_offer_columns", std::string("SELECT ") + SWAP_COLUMNS + " FROM swap_offer LIMIT 1;"});
    return steps;
  }();
  return schema;
}

const Schema& PostgresSchema() {
  static const Schema schema = Build(kPostgres);
  return schema;
}

} // namespace atomicswap::db::sql
