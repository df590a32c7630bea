#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace atomicswap::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

} // namespace

Result MemoryRepository::InsertSwap(Transaction& t, const model::SwapRecord& r) {
  auto& swaps = TX(t).Write(r.id);
  if (!swaps.try_emplace(r.id, r).second) {
    return Result::Err(ErrorCode::AlreadyExists, "swap " + r.id + " already exists");
  }
  return Result::Ok();
}

std::optional<model::SwapRecord> MemoryRepository::GetSwap(Transaction& t, const std::string& id) {
  const auto& swaps = TX(t).Read();
  if (auto it = swaps.find(id); it != swaps.end()) return it->second;
  return std::nullopt;
}

std::vector<model::SwapRecord> MemoryRepository::ListSwaps(Transaction& t, const SwapFilter& filter) {
  std::vector<model::SwapRecord> records;
  for (const auto& [id, record] : TX(t).Read()) {
    if (filter.Matches(record.status)) {
      records.push_back(record);
    }
  }
  std::sort(records.begin(), records.end(), [](const model::SwapRecord& a, const model::SwapRecord& b) {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id > b.id;
  });
  return records;
}

Result MemoryRepository::UpdateSwap(Transaction& t, const std::string& id, const model::SwapUpdate& update) {
  auto& swaps = TX(t).Write(id);
  auto  it    = swaps.find(id);
  if (it == swaps.end()) return Result::Err(ErrorCode::NotFound, "swap " + id + " not found");
  if (it->second.version != update.expected_version) {
    return Result::Err(ErrorCode::Conflict, "swap " + id + " version " + std::to_string(it->second.version) + " != expected " +
                                                std::to_string(update.expected_version));
  }
  model::Apply(it->second, update);
  return Result::Ok();
}

} // namespace atomicswap::db::memory
