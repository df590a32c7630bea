#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace atomicswap::db::memory {

class MemoryTransaction;

// Process-local store for tests and single-node runs without persistence.
class MemoryRepository final : public db::Repository {
 public:
  using SwapMap = std::unordered_map<std::string, model::SwapRecord>;

  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertSwap(Transaction&, const model::SwapRecord&) override;
  std::optional<model::SwapRecord> GetSwap(Transaction&, const std::string&) override;
  std::vector<model::SwapRecord>   ListSwaps(Transaction&, const SwapFilter&) override;
  Result                           UpdateSwap(Transaction&, const std::string&, const model::SwapUpdate&) override;

 private:
  friend class MemoryTransaction;

  std::mutex mutex_;
  SwapMap    committed_;
};

} // namespace atomicswap::db::memory
