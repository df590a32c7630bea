#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace atomicswap::db::postgres {

// pqxx::work on a connection checked out of PgPool for the transaction's lifetime.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work() { return *work_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

 private:
  // Declared first so the work is destroyed before the connection goes back.
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              open_      = true;
  bool                              committed_ = false;
};

} // namespace atomicswap::db::postgres
