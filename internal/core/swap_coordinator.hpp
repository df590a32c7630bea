#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/settlement/settlement_backend.hpp"

namespace atomicswap::core {

struct SwapPolicy {
  std::chrono::milliseconds initiator_timelock{std::chrono::hours(24)};
  std::chrono::milliseconds acceptor_timelock{std::chrono::hours(12)};
};

struct CreateOfferParams {
  std::string initiator_asset;
  std::string initiator_amount;
  std::string acceptor_asset;
  std::string acceptor_amount;
  std::string initiator_address;
};

struct ClaimResult {
  db::model::SwapRecord swap;
  std::string           secret; // hex
};

using AssetBalance = std::pair<std::string, model::Amount>;

/*
  SwapCoordinator

  Drives one swap through the HTLC protocol:

      OFFERED -> ACCEPTED -> INITIATOR_LOCKED -> ACCEPTOR_LOCKED
              -> INITIATOR_CLAIMED -> COMPLETED

  with REFUNDED reachable from any locked state once the relevant timelock
  passed, and CANCELLED from OFFERED.

  Every mutation holds the per-swap mutex for load, validate, backend call
  and persist. Persistence is a compare-and-set on the record version, so
  a writer in another process surfaces as InvalidState instead of a lost
  update. Backend calls never run inside a store transaction.
*/
class SwapCoordinator {
 public:
  SwapCoordinator(settlement::BackendMap backends, std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock,
                  SwapPolicy policy);

  db::model::SwapRecord CreateOffer(const CreateOfferParams& params);
  db::model::SwapRecord AcceptOffer(const std::string& id, const std::string& acceptor_address);

  db::model::SwapRecord LockInitiatorFunds(const std::string& id);
  db::model::SwapRecord LockAcceptorFunds(const std::string& id);

  // Only response that carries the secret.
  ClaimResult ClaimInitiator(const std::string& id);

  // secret_hex, if given, must match the hashlock.
  db::model::SwapRecord ClaimAcceptor(const std::string& id, const std::optional<std::string>& secret_hex);

  // automatic marks refunds issued by the monitor.
  db::model::SwapRecord RefundInitiator(const std::string& id, bool automatic = false);
  db::model::SwapRecord RefundAcceptor(const std::string& id, bool automatic = false);

  db::model::SwapRecord CancelOffer(const std::string& id);

  db::model::SwapRecord              GetSwap(const std::string& id);
  std::vector<db::model::SwapRecord> ListSwaps(const db::SwapFilter& filter);
  std::vector<AssetBalance>          Balances();

  const SwapPolicy& Policy() const {
    return policy_;
  }

  // Leg still locked, unredeemed and unrefunded.
  static bool InitiatorLegOutstanding(const db::model::SwapRecord& swap);
  static bool AcceptorLegOutstanding(const db::model::SwapRecord& swap);

 private:
  std::shared_ptr<std::mutex> SwapMutex(const std::string& id);

  util::TimePoint Now() const;

  db::model::SwapRecord Load(const std::string& id, const char* context);

  void Persist(db::model::SwapRecord& swap, db::model::SwapUpdate update, const char* context);

  // Same as Persist, but logs the orphaned backend reference when the
  // write fails after the backend already acted.
  void PersistAfterBackend(db::model::SwapRecord& swap, db::model::SwapUpdate update, const char* context, const std::string& ref);

  settlement::SettlementBackend& Backend(const std::string& asset);

  settlement::BackendMap             backends_;
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<const util::Clock> clock_;
  SwapPolicy                         policy_;

  mutable std::mutex                                           swap_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> swap_mutexes_;
};

} // namespace atomicswap::core
