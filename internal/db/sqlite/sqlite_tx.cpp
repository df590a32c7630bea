#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace atomicswap::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->WriterLock()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) {
    return;
  }
  try {
    End("ROLLBACK;", State::kRolledBack);
  } catch (const std::exception& e) {
    ATOMICSWAP_LOG_WARN("sqlite implicit rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  End("COMMIT;", State::kCommitted);
}

void SqliteTransaction::Rollback() {
  End("ROLLBACK;", State::kRolledBack);
}

void SqliteTransaction::End(const char* sql, State next) {
  if (state_ != State::kOpen) {
    return;
  }
  db_->Exec(sql);
  state_ = next;
  writer_.unlock();
}

} // namespace atomicswap::db::sqlite
