#pragma once

#include <map>
#include <memory>
#include <string>

#include "internal/model/amount.hpp"
#include "internal/util/clock.hpp"

namespace atomicswap::settlement {

struct LockRequest {
  model::Amount   amount;
  std::string     hashlock; // hex sha256
  util::TimePoint timelock; // absolute
  std::string     recipient;
};

/*
  SettlementBackend

  One per asset. Everything the coordinator needs from a ledger.

  Every call may throw:
    util::BackendUnavailable  transient, nothing was submitted; retry is safe
    util::BackendRejected     terminal for this attempt

  A returned reference means "submitted", not "final". Finality tracking
  belongs to the backend implementation.
*/
class SettlementBackend {
 public:
  virtual ~SettlementBackend() = default;

  virtual const std::string& Asset() const = 0;

  // Returns the lock reference.
  virtual std::string Lock(const LockRequest& request) = 0;

  // Pays the lock out to its recipient. Returns the redeem reference.
  virtual std::string Redeem(const std::string& lock_ref, const std::string& secret_hex) = 0;

  // Returns an expired lock to its owner. Returns the refund reference.
  virtual std::string Refund(const std::string& lock_ref) = 0;

  virtual model::Amount Balance() = 0;
};

// keyed by lower-case asset tag
using BackendMap = std::map<std::string, std::shared_ptr<SettlementBackend>>;

} // namespace atomicswap::settlement
