#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace atomicswap::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertSwap(Transaction&, const model::SwapRecord&) override;
  std::optional<model::SwapRecord> GetSwap(Transaction&, const std::string&) override;
  std::vector<model::SwapRecord>   ListSwaps(Transaction&, const SwapFilter&) override;
  Result                           UpdateSwap(Transaction&, const std::string&, const model::SwapUpdate&) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace atomicswap::db::postgres
