#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace atomicswap::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool)
    : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {}

PgTransaction::~PgTransaction() {
  if (!open_) {
    return;
  }
  try {
    work_->abort();
  } catch (const std::exception& e) {
    ATOMICSWAP_LOG_WARN("postgres implicit rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (!open_) {
    return;
  }
  work_->commit();
  open_      = false;
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (!open_) {
    return;
  }
  work_->abort();
  open_ = false;
}

} // namespace atomicswap::db::postgres
