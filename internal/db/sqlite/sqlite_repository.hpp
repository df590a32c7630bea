#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace atomicswap::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertSwap(Transaction&, const model::SwapRecord&) override;
  std::optional<model::SwapRecord> GetSwap(Transaction&, const std::string&) override;
  std::vector<model::SwapRecord>   ListSwaps(Transaction&, const SwapFilter&) override;
  Result                           UpdateSwap(Transaction&, const std::string&, const model::SwapUpdate&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace atomicswap::db::sqlite
