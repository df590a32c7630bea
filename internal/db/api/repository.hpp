#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/swap_record.hpp"

namespace atomicswap::db {

struct SwapFilter {
  // Empty matches every status.
  std::vector<atomicswap::model::SwapStatus> statuses;

  static SwapFilter All() {
    return {};
  }

  static SwapFilter ByStatus(atomicswap::model::SwapStatus status) {
    return {{status}};
  }

  // Open for acceptance.
  static SwapFilter Open() {
    return {{atomicswap::model::SwapStatus::kOffered}};
  }

  static SwapFilter Active() {
    using atomicswap::model::SwapStatus;
    return {{SwapStatus::kAccepted, SwapStatus::kInitiatorLocked, SwapStatus::kAcceptorLocked, SwapStatus::kInitiatorClaimed}};
  }

  bool Matches(atomicswap::model::SwapStatus status) const {
    if (statuses.empty()) return true;
    for (auto s : statuses) {
      if (s == status) return true;
    }
    return false;
  }
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateSwap is a compare-and-set on version: it fails with Conflict
    unless the stored version equals expected_version, and increments it
  - ListSwaps returns newest first (created_at DESC, id DESC)

  The DB is the source of truth for swap state.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Swaps
  // ---------------------------------------------------------------------

  // AlreadyExists if the id is taken.
  virtual Result InsertSwap(Transaction&, const model::SwapRecord&) = 0;

  virtual std::optional<model::SwapRecord> GetSwap(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::SwapRecord> ListSwaps(Transaction&, const SwapFilter& filter) = 0;

  // NotFound if absent, Conflict on version mismatch.
  virtual Result UpdateSwap(Transaction&, const std::string& id, const model::SwapUpdate& update) = 0;
};

} // namespace atomicswap::db
