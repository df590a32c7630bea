#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace atomicswap::db::sqlite {

// Holds the connection's writer lock from BEGIN IMMEDIATE until it ends, so a
// second process sharing the file waits on busy_timeout rather than losing at COMMIT.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

 private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void End(const char* sql, State next);

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_;
  State                        state_ = State::kOpen;
};

} // namespace atomicswap::db::sqlite
