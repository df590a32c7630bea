#include "sqlite_db.hpp"

#include <stdexcept>

namespace atomicswap::db::sqlite {
namespace {

constexpr int kOpenFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

std::string LastError(sqlite3* db, const char* fallback) {
  return db != nullptr ? sqlite3_errmsg(db) : fallback;
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  if (sqlite3_open_v2(path_.c_str(), &db_, kOpenFlags, nullptr) != SQLITE_OK) {
    const std::string reason = LastError(db_, "out of memory");
    sqlite3_close(db_); // accepts nullptr
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + reason);
  }

  try {
    ApplyPragmas(wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* raw_error = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &raw_error) == SQLITE_OK) {
    return;
  }
  std::unique_ptr<char, decltype(&sqlite3_free)> error(raw_error, &sqlite3_free);
  throw std::runtime_error("sqlite: " + (error ? std::string(error.get()) : LastError(db_, "exec failed")));
}

void SqliteDB::ApplyPragmas(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  // A swap must not roll back to a state older than a backend call already made.
  Exec("PRAGMA synchronous=FULL;");
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error("sqlite busy_timeout: " + LastError(db_, "failed"));
  }
}

} // namespace atomicswap::db::sqlite
