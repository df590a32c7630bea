#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sql/swap_sql.hpp"

namespace atomicswap::db::sqlite {

using atomicswap::db::ErrorCode;
using atomicswap::db::Result;

namespace {

// Finalizes on scope exit.
struct Stmt {
  sqlite3_stmt* st = nullptr;
  ~Stmt() {
    if (st) sqlite3_finalize(st);
  }
};

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  std::int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

void Bind(sqlite3_stmt* st, const sql::Params& params) {
  for (std::size_t i = 0; i < params.size(); ++i) {
    const int idx = static_cast<int>(i) + 1;
    const auto& p = params[i];
    if (std::holds_alternative<std::nullptr_t>(p)) {
      sqlite3_bind_null(st, idx);
    } else if (const auto* v = std::get_if<std::int64_t>(&p)) {
      sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
    } else {
      const auto& s = std::get<std::string>(p);
      sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
  }
}

bool Prepare(sqlite3* db, const std::string& sql, Stmt& out) {
  return sqlite3_prepare_v2(db, sql.c_str(), -1, &out.st, nullptr) == SQLITE_OK;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Swaps
// ------------------------------------------------------------------

Result SqliteRepository::InsertSwap(Transaction& t, const model::SwapRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st;
  if (!Prepare(db, sql::INSERT_SWAP, st)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  Bind(st.st, sql::InsertParams(r));
  int rc = sqlite3_step(st.st);
  return Translate(db, rc);
}

std::optional<model::SwapRecord> SqliteRepository::GetSwap(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Stmt st;
  if (!Prepare(db, sql::SELECT_SWAP, st)) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  Bind(st.st, {id});

  int rc = sqlite3_step(st.st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return sql::ReadSwap(SqliteRow(st.st));
}

std::vector<model::SwapRecord> SqliteRepository::ListSwaps(Transaction& t, const SwapFilter& filter) {
  auto* db = TX(t).Handle();

  auto statement = sql::BuildList(filter);
  Stmt st;
  if (!Prepare(db, statement.sql, st)) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  Bind(st.st, statement.params);

  std::vector<model::SwapRecord> out;
  int                            rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.st)) == SQLITE_ROW) {
    out.push_back(sql::ReadSwap(SqliteRow(st.st)));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

Result SqliteRepository::UpdateSwap(Transaction& t, const std::string& id, const model::SwapUpdate& update) {
  auto* db = TX(t).Handle();

  auto statement = sql::BuildUpdate(id, update);
  Stmt st;
  if (!Prepare(db, statement.sql, st)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Bind(st.st, statement.params);

  int rc = sqlite3_step(st.st);
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 1) return Result::Ok();

  // Nothing matched: tell absent from stale apart.
  Stmt probe;
  if (!Prepare(db, sql::SELECT_SWAP_VERSION, probe)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Bind(probe.st, {id});
  if (sqlite3_step(probe.st) != SQLITE_ROW) {
    return Result::Err(ErrorCode::NotFound, "swap " + id + " not found");
  }
  return Result::Err(ErrorCode::Conflict, "swap " + id + " version " + std::to_string(sqlite3_column_int64(probe.st, 0)) +
                                              " != expected " + std::to_string(update.expected_version));
}

} // namespace atomicswap::db::sqlite
