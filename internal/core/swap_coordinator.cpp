#include "swap_coordinator.hpp"

#include <stdexcept>

#include "internal/htlc/commitment.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace atomicswap::core {

using db::model::SwapRecord;
using db::model::SwapUpdate;
using model::SwapAction;
using model::SwapStatus;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(context + ": swap modified concurrently; reload and retry");
    default:
      throw std::runtime_error(message + " (" + std::string(db::ToString(result.code)) + ")");
  }
}

// Resolves the target status or throws InvalidState.
SwapStatus Require(SwapAction action, const SwapRecord& swap, const char* context) {
  const auto next = model::NextStatus(action, swap.status);
  if (!next) {
    throw util::InvalidState(std::string(context) + ": swap " + swap.id + " is " + std::string(model::ToString(swap.status)));
  }
  return *next;
}

// Records success or failure of one coordinator action.
template <typename Fn>
auto Observed(SwapAction action, Fn&& fn) -> decltype(fn()) {
  auto& metrics = observability::Metrics::Instance();
  try {
    auto result = fn();
    metrics.RecordTransition(model::ToString(action), true);
    return result;
  } catch (const std::exception&) {
    metrics.RecordTransition(model::ToString(action), false);
    throw;
  }
}

std::string NormalizeAsset(const std::string& asset) {
  return util::ToLower(asset);
}

} // namespace

SwapCoordinator::SwapCoordinator(settlement::BackendMap backends, std::shared_ptr<db::Repository> repository,
                                 std::shared_ptr<const util::Clock> clock, SwapPolicy policy)
    : backends_(std::move(backends)), repository_(std::move(repository)), clock_(std::move(clock)), policy_(policy) {
  if (!repository_) {
    throw std::invalid_argument("swap coordinator: repository is required");
  }
  if (!clock_) {
    throw std::invalid_argument("swap coordinator: clock is required");
  }
  if (policy_.acceptor_timelock.count() <= 0) {
    throw std::invalid_argument("swap coordinator: acceptor timelock must be positive");
  }
  // Stored timelocks have one-second resolution.
  if (policy_.initiator_timelock % std::chrono::seconds(1) != std::chrono::milliseconds::zero() ||
      policy_.acceptor_timelock % std::chrono::seconds(1) != std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("swap coordinator: timelocks must be whole seconds");
  }
  if (policy_.acceptor_timelock >= policy_.initiator_timelock) {
    throw std::invalid_argument("swap coordinator: acceptor timelock must be strictly shorter than initiator timelock");
  }
  for (const auto& [asset, backend] : backends_) {
    if (!backend) {
      throw std::invalid_argument("swap coordinator: backend for " + asset + " is null");
    }
  }
}

bool SwapCoordinator::InitiatorLegOutstanding(const SwapRecord& swap) {
  return swap.initiator_txid.has_value() && !swap.acceptor_claim_txid.has_value() && !swap.initiator_refund_txid.has_value();
}

bool SwapCoordinator::AcceptorLegOutstanding(const SwapRecord& swap) {
  return swap.acceptor_txid.has_value() && !swap.initiator_claim_txid.has_value() && !swap.acceptor_refund_txid.has_value();
}

std::shared_ptr<std::mutex> SwapCoordinator::SwapMutex(const std::string& id) {
  std::lock_guard<std::mutex> lock(swap_mutexes_guard_);
  auto&                       swap_mutex = swap_mutexes_[id];
  if (!swap_mutex) {
    swap_mutex = std::make_shared<std::mutex>();
  }
  return swap_mutex;
}

util::TimePoint SwapCoordinator::Now() const {
  return util::TruncateToSeconds(clock_->Now());
}

SwapRecord SwapCoordinator::Load(const std::string& id, const char* context) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetSwap(*tx, id);
  tx->Commit();
  if (!record.has_value()) {
    throw util::NotFound(std::string(context) + ": swap " + id + " not found; verify swap id");
  }
  return *record;
}

void SwapCoordinator::Persist(SwapRecord& swap, SwapUpdate update, const char* context) {
  update.expected_version = swap.version;
  update.updated_at       = Now();

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateSwap(*tx, swap.id, update), context);
  tx->Commit();

  db::model::Apply(swap, update);
}

void SwapCoordinator::PersistAfterBackend(SwapRecord& swap, SwapUpdate update, const char* context, const std::string& ref) {
  try {
    Persist(swap, std::move(update), context);
  } catch (const std::exception& e) {
    ATOMICSWAP_LOG_ERROR("backend action not recorded", {StringField("swap_id", swap.id), StringField("context", context),
                                                          StringField("backend_ref", ref), StringField("error", e.what())});
    throw;
  }
}

settlement::SettlementBackend& SwapCoordinator::Backend(const std::string& asset) {
  const auto it = backends_.find(asset);
  if (it == backends_.end()) {
    throw util::InvalidState("no settlement backend configured for asset " + asset);
  }
  return *it->second;
}

SwapRecord SwapCoordinator::CreateOffer(const CreateOfferParams& params) {
  return Observed(SwapAction::kCreate, [&] {
    SwapRecord swap;
    swap.initiator_asset = NormalizeAsset(params.initiator_asset);
    swap.acceptor_asset  = NormalizeAsset(params.acceptor_asset);

    if (swap.initiator_asset.empty() || swap.acceptor_asset.empty()) {
      throw util::Validation("create offer: both assets are required");
    }
    if (swap.initiator_asset == swap.acceptor_asset) {
      throw util::Validation("create offer: assets must differ");
    }
    for (const auto& asset : {swap.initiator_asset, swap.acceptor_asset}) {
      if (backends_.find(asset) == backends_.end()) {
        throw util::Validation("create offer: unknown asset " + asset);
      }
    }

    swap.initiator_amount = model::Amount::ParsePositive(params.initiator_amount, "initiator_amount");
    swap.acceptor_amount  = model::Amount::ParsePositive(params.acceptor_amount, "acceptor_amount");

    if (params.initiator_address.empty()) {
      throw util::Validation("create offer: initiator_address is required");
    }
    swap.initiator_address = params.initiator_address;

    const auto secret = htlc::GenerateSecret();
    swap.id           = util::NewId();
    swap.status       = SwapStatus::kOffered;
    swap.secret       = htlc::SecretToHex(secret);
    swap.hashlock     = htlc::Hashlock(secret);

    swap.initiator_timelock = htlc::MakeTimelock(*clock_, policy_.initiator_timelock);
    swap.acceptor_timelock  = htlc::MakeTimelock(*clock_, policy_.acceptor_timelock);
    if (swap.acceptor_timelock >= swap.initiator_timelock) {
      throw util::InvalidState("create offer: acceptor timelock does not precede initiator timelock");
    }
    swap.created_at         = Now();
    swap.updated_at         = swap.created_at;
    swap.version            = 1;

    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertSwap(*tx, swap), "create offer");
    tx->Commit();

    ATOMICSWAP_LOG_INFO("swap offered", {StringField("swap_id", swap.id), StringField("initiator_asset", swap.initiator_asset),
                                         StringField("initiator_amount", swap.initiator_amount.ToString()),
                                         StringField("acceptor_asset", swap.acceptor_asset),
                                         StringField("acceptor_amount", swap.acceptor_amount.ToString())});
    return swap;
  });
}

SwapRecord SwapCoordinator::AcceptOffer(const std::string& id, const std::string& acceptor_address) {
  return Observed(SwapAction::kAccept, [&] {
    if (acceptor_address.empty()) {
      throw util::Validation("accept offer: acceptor_address is required");
    }

    std::lock_guard<std::mutex> swap_lock(*SwapMutex(id));

    auto       swap = Load(id, "accept offer");
    const auto next = Require(SwapAction::kAccept, swap, "accept offer");
    if (htlc::IsExpired(*clock_, swap.acceptor_timelock)) {
      throw util::InvalidState("accept offer: offer " + id + " is stale; acceptor timelock already passed");
    }

    SwapUpdate update;
    update.status           = next;
    update.acceptor_address = acceptor_address;
    update.accepted_at      = Now();
    Persist(swap, std::move(update), "accept offer");

    ATOMICSWAP_LOG_INFO("swap accepted", {StringField("swap_id", id)});
    return swap;
  });
}

SwapRecord SwapCoordinator::LockInitiatorFunds(const std::string& id) {
  return Observed(SwapAction::kLockInitiator, [&] {
    std::lock_guard<std::mutex> swap_lock(*SwapMutex(id));

    auto       swap = Load(id, "lock initiator funds");
    const auto next = Require(SwapAction::kLockInitiator, swap, "lock initiator funds");
    if (htlc::IsExpired(*clock_, swap.initiator_timelock)) {
      throw util::InvalidState("lock initiator funds: initiator timelock already passed");
    }
    if (!swap.acceptor_address.has_value()) {
      throw util::InvalidState("lock initiator funds: swap " + id + " has no acceptor address");
    }

    const auto txid = Backend(swap.initiator_asset)
                          .Lock({swap.initiator_amount, swap.hashlock, swap.initiator_timelock, *swap.acceptor_address});

    SwapUpdate update;
    update.status         = next;
    update.initiator_txid = txid;
    PersistAfterBackend(swap, std::move(update), "lock initiator funds", txid);

    ATOMICSWAP_LOG_INFO("initiator funds locked", {StringField("swap_id", id), StringField("txid", txid)});
    return swap;
  });
}

SwapRecord SwapCoordinator::LockAcceptorFunds(const std::string& id) {
  return Observed(SwapAction::kLockAcceptor, [&] {
    std::lock_guard<std::mutex> swap_lock(*SwapMutex(id));

    auto       swap = Load(id, "lock acceptor funds");
    const auto next = Require(SwapAction::kLockAcceptor, swap, "lock acceptor funds");
    if (htlc::IsExpired(*clock_, swap.acceptor_timelock)) {
      throw util::InvalidState("lock acceptor funds: acceptor timelock already passed");
    }

    std::string txid;
    try {
      txid = Backend(swap.acceptor_asset).Lock({swap.acceptor_amount, swap.hashlock, swap.acceptor_timelock, swap.initiator_address});
    } catch (const util::BackendRejected& e) {
      // Status stays INITIATOR_LOCKED; only the audit marker is written.
      SwapUpdate marker;
      marker.last_error = std::optional<std::string>(e.what());
      marker.failed_at  = std::optional<util::TimePoint>(Now());
      try {
        Persist(swap, std::move(marker), "lock acceptor funds");
      } catch (const std::exception& persist_error) {
        ATOMICSWAP_LOG_ERROR("failed to record rejected acceptor lock",
                             {StringField("swap_id", id), StringField("error", persist_error.what())});
      }
      ATOMICSWAP_LOG_WARN("acceptor lock rejected", {StringField("swap_id", id), StringField("error", e.what())});
      throw;
    }

    SwapUpdate update;
    update.status        = next;
    update.acceptor_txid = txid;
    if (swap.last_error.has_value() || swap.failed_at.has_value()) {
      update.last_error = std::optional<std::string>();
      update.failed_at  = std::optional<util::TimePoint>();
    }
    PersistAfterBackend(swap, std::move(update), "lock acceptor funds", txid);

    ATOMICSWAP_LOG_INFO("acceptor funds locked", {StringField("swap_id", id), StringField("txid", txid)});
    return swap;
  });
}

ClaimResult SwapCoordinator::ClaimInitiator(const std::string& id) {
  return Observed(SwapAction::kClaimInitiator, [&] {
    std::lock_guard<std::mutex> swap_lock(*SwapMutex(id));

    auto       swap = Load(id, "claim initiator");
    const auto next = Require(SwapAction::kClaimInitiator, swap, "claim initiator");
    if (htlc::IsExpired(*clock_, swap.acceptor_timelock)) {
      throw util::InvalidState("claim initiator: acceptor timelock passed; acceptor may refund");
    }
    if (!swap.acceptor_txid.has_value()) {
      throw util::InvalidState("claim initiator: swap " + id + " has no acceptor lock");
    }

    const auto txid = Backend(swap.acceptor_asset).Redeem(*swap.acceptor_txid, swap.secret);

    SwapUpdate update;
    update.status               = next;
    update.initiator_claim_txid = txid;
    PersistAfterBackend(swap, std::move(update), "claim initiator", txid);

    ATOMICSWAP_LOG_INFO("initiator claimed", {StringField("swap_id", id), StringField("txid", txid)});
    ClaimResult result{swap, swap.secret};
    return result;
  });
}

SwapRecord SwapCoordinator::ClaimAcceptor(const std::string& id, const std::optional<std::string>& secret_hex) {
  return Observed(SwapAction::kClaimAcceptor, [&] {
    std::lock_guard<std::mutex> swap_lock(*SwapMutex(id));

    auto       swap = Load(id, "claim acceptor");
    const auto next = Require(SwapAction::kClaimAcceptor, swap, "claim acceptor");

    std::string secret = swap.secret;
    if (secret_hex.has_value() && !secret_hex->empty()) {
      const auto supplied = htlc::SecretFromHex(*secret_hex);
      if (!htlc::Verify(supplied, swap.hashlock)) {
        throw util::Validation("claim acceptor: secret does not match hashlock");
      }
      secret = htlc::SecretToHex(supplied);
    }

    if (htlc::IsExpired(*clock_, swap.initiator_timelock)) {
      throw util::InvalidState("claim acceptor: initiator timelock passed; initiator may refund");
    }
    if (!swap.initiator_txid.has_value()) {
      throw util::InvalidState("claim acceptor: swap " + id + " has no initiator lock");
    }

    const auto txid = Backend(swap.initiator_asset).Redeem(*swap.initiator_txid, secret);

    SwapUpdate update;
    update.status              = next;
    update.acceptor_claim_txid = txid;
    update.completed_at        = Now();
    PersistAfterBackend(swap, std::move(update), "claim acceptor", txid);

    ATOMICSWAP_LOG_INFO("swap completed", {StringField("swap_id", id), StringField("txid", txid)});
    return swap;
  });
}

SwapRecord SwapCoordinator::RefundInitiator(const std::string& id, bool automatic) {
  return Observed(SwapAction::kRefundInitiator, [&] {
    std::lock_guard<std::mutex> swap_lock(*SwapMutex(id));

    auto       swap = Load(id, "refund initiator");
    const auto next = Require(SwapAction::kRefundInitiator, swap, "refund initiator");
    if (!InitiatorLegOutstanding(swap)) {
      throw util::InvalidState("refund initiator: initiator lock of swap " + id + " is absent or already settled");
    }
    if (!htlc::IsExpired(*clock_, swap.initiator_timelock)) {
      throw util::TimelockNotExpired("refund initiator: initiator timelock has not passed");
    }

    const auto txid = Backend(swap.initiator_asset).Refund(*swap.initiator_txid);

    SwapUpdate update;
    update.status                = next;
    update.initiator_refund_txid = txid;
    PersistAfterBackend(swap, std::move(update), "refund initiator", txid);

    observability::Metrics::Instance().RecordRefund("initiator", automatic);
    ATOMICSWAP_LOG_INFO("initiator refunded",
                        {StringField("swap_id", id), StringField("txid", txid), observability::BoolField("automatic", automatic)});
    return swap;
  });
}

SwapRecord SwapCoordinator::RefundAcceptor(const std::string& id, bool automatic) {
  return Observed(SwapAction::kRefundAcceptor, [&] {
    std::lock_guard<std::mutex> swap_lock(*SwapMutex(id));

    auto       swap = Load(id, "refund acceptor");
    const auto next = Require(SwapAction::kRefundAcceptor, swap, "refund acceptor");
    if (!AcceptorLegOutstanding(swap)) {
      throw util::InvalidState("refund acceptor: acceptor lock of swap " + id + " is absent or already settled");
    }
    if (!htlc::IsExpired(*clock_, swap.acceptor_timelock)) {
      throw util::TimelockNotExpired("refund acceptor: acceptor timelock has not passed");
    }

    const auto txid = Backend(swap.acceptor_asset).Refund(*swap.acceptor_txid);

    SwapUpdate update;
    update.status               = next;
    update.acceptor_refund_txid = txid;
    PersistAfterBackend(swap, std::move(update), "refund acceptor", txid);

    observability::Metrics::Instance().RecordRefund("acceptor", automatic);
    ATOMICSWAP_LOG_INFO("acceptor refunded",
                        {StringField("swap_id", id), StringField("txid", txid), observability::BoolField("automatic", automatic)});
    return swap;
  });
}

SwapRecord SwapCoordinator::CancelOffer(const std::string& id) {
  return Observed(SwapAction::kCancel, [&] {
    std::lock_guard<std::mutex> swap_lock(*SwapMutex(id));

    auto       swap = Load(id, "cancel offer");
    const auto next = Require(SwapAction::kCancel, swap, "cancel offer");

    SwapUpdate update;
    update.status = next;
    Persist(swap, std::move(update), "cancel offer");

    ATOMICSWAP_LOG_INFO("swap cancelled", {StringField("swap_id", id)});
    return swap;
  });
}

SwapRecord SwapCoordinator::GetSwap(const std::string& id) {
  return Load(id, "get offer");
}

std::vector<SwapRecord> SwapCoordinator::ListSwaps(const db::SwapFilter& filter) {
  auto tx    = repository_->Begin();
  auto swaps = repository_->ListSwaps(*tx, filter);
  tx->Commit();
  return swaps;
}

std::vector<AssetBalance> SwapCoordinator::Balances() {
  std::vector<AssetBalance> balances;
  balances.reserve(backends_.size());
  for (const auto& [asset, backend] : backends_) {
    balances.emplace_back(asset, backend->Balance());
  }
  return balances;
}

} // namespace atomicswap::core
