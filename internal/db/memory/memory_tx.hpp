#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace atomicswap::db::memory {

// Private copy of the committed map plus the version each written id had
// when the copy was taken. Commit() publishes the written ids only if none of
// them moved in the meantime; otherwise it throws util::InvalidState.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override { open_ = false; }
  bool IsCommitted() const override { return committed_; }

  const MemoryRepository::SwapMap& Read() const { return snapshot_; }

  // Registers id in the write set before handing out the mutable map.
  MemoryRepository::SwapMap& Write(const std::string& id);

 private:
  using Version = std::optional<std::uint64_t>; // nullopt: id absent

  MemoryRepository&                        repo_;
  MemoryRepository::SwapMap                snapshot_;
  std::unordered_map<std::string, Version> write_set_;
  bool                                     open_      = true;
  bool                                     committed_ = false;
};

} // namespace atomicswap::db::memory
