#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace atomicswap::db::sqlite {

// Owns the single sqlite3 connection behind SqliteRepository. Opened in
// serialized (FULLMUTEX) mode; writers additionally take WriterLock() for
// the span of a transaction.
class SqliteDB : public sql::MigrationExecutor {
 public:
  // Creates the file if missing. wal_mode has no effect on ":memory:".
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3*           Handle() const { return db_; }
  const std::string& Path() const { return path_; }

  // Runs one or more statements without results; throws runtime_error.
  void Exec(const std::string& sql);
  void ExecuteSQL(const std::string& sql) override { Exec(sql); }

  std::unique_lock<std::mutex> WriterLock() { return std::unique_lock<std::mutex>(writer_mutex_); }

 private:
  static constexpr int kBusyTimeoutMs = 5000;

  void ApplyPragmas(bool wal_mode);

  std::string path_;
  sqlite3*    db_ = nullptr;
  std::mutex  writer_mutex_;
};

} // namespace atomicswap::db::sqlite
