#include "simulated_ledger.hpp"

#include <thread>

#include "internal/htlc/commitment.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace atomicswap::settlement::simulated {

SimulatedLedger::SimulatedLedger(std::string asset, model::Amount initial_balance, std::shared_ptr<const util::Clock> clock)
    : asset_(std::move(asset)), clock_(std::move(clock)), balance_(initial_balance) {
}

void SimulatedLedger::BeforeCall(std::string_view op) {
  std::chrono::milliseconds latency{0};
  {
    std::lock_guard lock(mutex_);
    latency = latency_;
  }
  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }

  std::lock_guard lock(mutex_);
  if (!available_) {
    throw util::BackendUnavailable(asset_ + " ledger unavailable (" + std::string(op) + ")");
  }
  if (failures_left_ > 0) {
    --failures_left_;
    throw util::BackendUnavailable(asset_ + " ledger transient failure (" + std::string(op) + ")");
  }
}

std::string SimulatedLedger::NextRef(std::string_view kind) {
  return asset_ + "-" + std::string(kind) + "-" + util::NewId();
}

std::string SimulatedLedger::Lock(const LockRequest& request) {
  BeforeCall("lock");

  if (request.amount.IsZero()) {
    throw util::BackendRejected("lock amount must be positive");
  }
  if (!htlc::IsWellFormedHashlock(request.hashlock)) {
    throw util::BackendRejected("malformed hashlock");
  }
  if (request.recipient.empty()) {
    throw util::BackendRejected("lock recipient is required");
  }
  if (htlc::IsExpired(*clock_, request.timelock)) {
    throw util::BackendRejected("lock timelock is already in the past");
  }

  std::lock_guard lock(mutex_);
  if (request.amount > balance_) {
    throw util::BackendRejected("insufficient " + asset_ + " balance: have " + balance_.ToString() + ", need " + request.amount.ToString());
  }

  LockEntry entry;
  entry.ref       = NextRef("lock");
  entry.amount    = request.amount;
  entry.hashlock  = request.hashlock;
  entry.timelock  = request.timelock;
  entry.recipient = request.recipient;

  balance_ -= request.amount;
  auto ref = entry.ref;
  locks_.emplace(ref, std::move(entry));
  return ref;
}

std::string SimulatedLedger::Redeem(const std::string& lock_ref, const std::string& secret_hex) {
  BeforeCall("redeem");

  htlc::Secret secret{};
  try {
    secret = htlc::SecretFromHex(secret_hex);
  } catch (const util::Validation& e) {
    throw util::BackendRejected(std::string("redeem rejected: ") + e.what());
  }

  std::lock_guard lock(mutex_);
  auto            it = locks_.find(lock_ref);
  if (it == locks_.end()) {
    throw util::BackendRejected("unknown lock " + lock_ref);
  }
  auto& entry = it->second;
  if (entry.state != LockState::kLocked) {
    throw util::BackendRejected("lock " + lock_ref + " already settled");
  }
  if (htlc::IsExpired(*clock_, entry.timelock)) {
    throw util::BackendRejected("lock " + lock_ref + " expired");
  }
  if (!htlc::Verify(secret, entry.hashlock)) {
    throw util::BackendRejected("secret does not match hashlock of " + lock_ref);
  }

  entry.state           = LockState::kRedeemed;
  entry.revealed_secret = htlc::SecretToHex(secret);
  credited_[entry.recipient] += entry.amount;
  return NextRef("redeem");
}

std::string SimulatedLedger::Refund(const std::string& lock_ref) {
  BeforeCall("refund");

  std::lock_guard lock(mutex_);
  auto            it = locks_.find(lock_ref);
  if (it == locks_.end()) {
    throw util::BackendRejected("unknown lock " + lock_ref);
  }
  auto& entry = it->second;
  if (entry.state != LockState::kLocked) {
    throw util::BackendRejected("lock " + lock_ref + " already settled");
  }
  if (!htlc::IsExpired(*clock_, entry.timelock)) {
    throw util::BackendRejected("lock " + lock_ref + " has not expired");
  }

  entry.state = LockState::kRefunded;
  balance_ += entry.amount;
  return NextRef("refund");
}

model::Amount SimulatedLedger::Balance() {
  BeforeCall("balance");
  std::lock_guard lock(mutex_);
  return balance_;
}

std::optional<SimulatedLedger::LockEntry> SimulatedLedger::GetLock(const std::string& lock_ref) const {
  std::lock_guard lock(mutex_);
  auto            it = locks_.find(lock_ref);
  if (it == locks_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> SimulatedLedger::RevealedSecret(const std::string& lock_ref) const {
  std::lock_guard lock(mutex_);
  auto            it = locks_.find(lock_ref);
  if (it == locks_.end()) return std::nullopt;
  return it->second.revealed_secret;
}

model::Amount SimulatedLedger::CreditedTo(const std::string& recipient) const {
  std::lock_guard lock(mutex_);
  auto            it = credited_.find(recipient);
  return it == credited_.end() ? model::Amount{} : it->second;
}

void SimulatedLedger::SetAvailable(bool available) {
  std::lock_guard lock(mutex_);
  available_ = available;
}

void SimulatedLedger::FailNextCalls(std::size_t count) {
  std::lock_guard lock(mutex_);
  failures_left_ = count;
}

void SimulatedLedger::SetLatency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

} // namespace atomicswap::settlement::simulated
