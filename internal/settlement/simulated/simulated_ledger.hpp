#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "internal/settlement/settlement_backend.hpp"

namespace atomicswap::settlement::simulated {

/*
  In-process HTLC ledger.

  Enforces the same rules a chain would: a lock debits the owner's
  balance, a redeem needs the pre-image before the timelock, a refund
  needs the timelock to have passed, and a lock settles exactly once.

  Fault injection hooks make the transient/terminal failure paths of
  the coordinator testable.
*/
class SimulatedLedger final : public SettlementBackend {
 public:
  enum class LockState {
    kLocked,
    kRedeemed,
    kRefunded,
  };

  struct LockEntry {
    std::string     ref;
    model::Amount   amount;
    std::string     hashlock;
    util::TimePoint timelock;
    std::string     recipient;
    LockState       state = LockState::kLocked;

    // set by a successful Redeem; public on a real chain
    std::optional<std::string> revealed_secret;
  };

  SimulatedLedger(std::string asset, model::Amount initial_balance, std::shared_ptr<const util::Clock> clock);

  const std::string& Asset() const override {
    return asset_;
  }

  std::string   Lock(const LockRequest& request) override;
  std::string   Redeem(const std::string& lock_ref, const std::string& secret_hex) override;
  std::string   Refund(const std::string& lock_ref) override;
  model::Amount Balance() override;

  // ---------------------------------------------------------------
  // Inspection
  // ---------------------------------------------------------------

  std::optional<LockEntry>   GetLock(const std::string& lock_ref) const;
  std::optional<std::string> RevealedSecret(const std::string& lock_ref) const;
  model::Amount              CreditedTo(const std::string& recipient) const;

  // ---------------------------------------------------------------
  // Fault injection
  // ---------------------------------------------------------------

  void SetAvailable(bool available);
  void FailNextCalls(std::size_t count);
  void SetLatency(std::chrono::milliseconds latency);

 private:
  void        BeforeCall(std::string_view op);
  std::string NextRef(std::string_view kind);

  const std::string                  asset_;
  std::shared_ptr<const util::Clock> clock_;

  mutable std::mutex               mutex_;
  model::Amount                    balance_;
  std::map<std::string, LockEntry> locks_;
  std::map<std::string, model::Amount> credited_;

  bool                      available_     = true;
  std::size_t               failures_left_ = 0;
  std::chrono::milliseconds latency_{0};
};

} // namespace atomicswap::settlement::simulated
