#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace atomicswap::db::postgres {

// Bounded pool of libpqxx connections, each with the swap statements prepared.
// A pqxx::connection is single-threaded, so every PgTransaction checks one out
// for its whole lifetime. Dropping the returned shared_ptr hands the
// connection back; a connection found closed at that point is discarded.
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Waits while every connection is checked out. Connect errors propagate.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::unique_ptr<pqxx::connection> Connect() const;
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              GiveBack(pqxx::connection* conn);

  const std::string conninfo_;
  const std::size_t capacity_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_ = 0;
};

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {}

  // Each statement commits in its own transaction.
  void ExecuteSQL(const std::string& sql) override;

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace atomicswap::db::postgres
