#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace atomicswap::db::memory {
namespace {

std::optional<std::uint64_t> VersionIn(const MemoryRepository::SwapMap& swaps, const std::string& id) {
  auto it = swaps.find(id);
  if (it == swaps.end()) return std::nullopt;
  return it->second.version;
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_ = repo_.committed_;
}

MemoryRepository::SwapMap& MemoryTransaction::Write(const std::string& id) {
  write_set_.try_emplace(id, VersionIn(snapshot_, id));
  return snapshot_;
}

void MemoryTransaction::Commit() {
  if (!open_) {
    return;
  }
  std::scoped_lock lock(repo_.mutex_);

  for (const auto& [id, base] : write_set_) {
    if (VersionIn(repo_.committed_, id) != base) {
      throw util::InvalidState("transaction conflict: swap " + id + " was modified by a concurrent transaction");
    }
  }
  for (const auto& [id, base] : write_set_) {
    if (auto it = snapshot_.find(id); it != snapshot_.end()) {
      repo_.committed_.insert_or_assign(id, it->second);
    }
  }
  open_      = false;
  committed_ = true;
}

} // namespace atomicswap::db::memory
