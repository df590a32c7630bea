#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sql/swap_sql.hpp"

namespace atomicswap::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), capacity_(max_connections > 0 ? max_connections : 1) {}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  returned_.wait(lock, [this] { return !idle_.empty() || open_ < capacity_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lend(std::move(conn));
  }

  // Reserve the slot, then connect without holding the lock.
  ++open_;
  lock.unlock();
  try {
    return Lend(Connect());
  } catch (const std::exception&) {
    lock.lock();
    --open_;
    lock.unlock();
    returned_.notify_one();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgPool::Connect() const {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  conn->prepare("get_swap", sql::ToPostgresPlaceholders(sql::SELECT_SWAP));
  conn->prepare("get_swap_version", sql::ToPostgresPlaceholders(sql::SELECT_SWAP_VERSION));
  conn->prepare("insert_swap", sql::ToPostgresPlaceholders(sql::INSERT_SWAP));
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = weak_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* lent) {
    if (auto self = pool.lock()) {
      self->GiveBack(lent);
    } else {
      delete lent;
    }
  });
}

void PgPool::GiveBack(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --open_;
    }
  }
  returned_.notify_one();
}

void PgMigrationExecutor::ExecuteSQL(const std::string& sql) {
  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  tx.exec(sql);
  tx.commit();
}

} // namespace atomicswap::db::postgres
