#include "refund_monitor.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/core/swap_coordinator.hpp"
#include "internal/htlc/commitment.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace atomicswap::monitor {

using model::SwapStatus;
using observability::StringField;

namespace {

enum class Outcome {
  kDone,
  kSkipped,
  kFailed,
};

template <typename Fn>
Outcome Attempt(const char* what, const std::string& id, Fn&& fn) {
  try {
    fn();
    return Outcome::kDone;
  } catch (const util::InvalidState& e) {
    ATOMICSWAP_LOG_DEBUG("refund monitor skipped swap", {StringField("swap_id", id), StringField("action", what), StringField("reason", e.what())});
  } catch (const util::NotFound& e) {
    ATOMICSWAP_LOG_DEBUG("refund monitor skipped swap", {StringField("swap_id", id), StringField("action", what), StringField("reason", e.what())});
  } catch (const util::TimelockNotExpired& e) {
    ATOMICSWAP_LOG_DEBUG("refund monitor skipped swap", {StringField("swap_id", id), StringField("action", what), StringField("reason", e.what())});
  } catch (const std::exception& e) {
    ATOMICSWAP_LOG_WARN("refund monitor action failed", {StringField("swap_id", id), StringField("action", what), StringField("error", e.what())});
    return Outcome::kFailed;
  }
  return Outcome::kSkipped;
}

void Count(Outcome outcome, std::size_t& done_counter, SweepStats& stats) {
  switch (outcome) {
    case Outcome::kDone:
      ++done_counter;
      break;
    case Outcome::kSkipped:
      ++stats.skipped;
      break;
    case Outcome::kFailed:
      ++stats.failed;
      break;
  }
}

} // namespace

RefundMonitor::RefundMonitor(std::shared_ptr<core::SwapCoordinator> coordinator, std::shared_ptr<const util::Clock> clock,
                             RefundMonitorOptions options)
    : coordinator_(std::move(coordinator)), clock_(std::move(clock)), options_(options) {
  if (!coordinator_ || !clock_) {
    throw std::invalid_argument("refund monitor: coordinator and clock are required");
  }
  if (options_.interval.count() <= 0) {
    throw std::invalid_argument("refund monitor: interval must be positive");
  }
}

RefundMonitor::~RefundMonitor() {
  Stop();
}

void RefundMonitor::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&RefundMonitor::Loop, this);
}

void RefundMonitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void RefundMonitor::Loop() {
  ATOMICSWAP_LOG_INFO("refund monitor started", {observability::IntField("interval_ms", options_.interval.count())});

  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    try {
      const auto stats = RunOnce();
      if (stats.refunded + stats.cancelled + stats.failed > 0) {
        ATOMICSWAP_LOG_INFO("refund sweep finished", {observability::IntField("refunded", static_cast<std::int64_t>(stats.refunded)),
                                                      observability::IntField("cancelled", static_cast<std::int64_t>(stats.cancelled)),
                                                      observability::IntField("skipped", static_cast<std::int64_t>(stats.skipped)),
                                                      observability::IntField("failed", static_cast<std::int64_t>(stats.failed))});
      }
    } catch (const std::exception& e) {
      ATOMICSWAP_LOG_ERROR("refund sweep failed", {StringField("error", e.what())});
    }
    lock.lock();
    cv_.wait_for(lock, options_.interval, [this] { return !running_; });
  }

  ATOMICSWAP_LOG_INFO("refund monitor stopped");
}

SweepStats RefundMonitor::RunOnce() {
  SweepStats stats;

  auto filter = db::SwapFilter::Active();
  filter.statuses.push_back(SwapStatus::kRefunded);

  for (const auto& swap : coordinator_->ListSwaps(filter)) {
    // The acceptor timelock expires first.
    if (core::SwapCoordinator::AcceptorLegOutstanding(swap) && htlc::IsExpired(*clock_, swap.acceptor_timelock)) {
      Count(Attempt("refund_acceptor", swap.id, [&] { coordinator_->RefundAcceptor(swap.id, true); }), stats.refunded, stats);
    }
    if (core::SwapCoordinator::InitiatorLegOutstanding(swap) && htlc::IsExpired(*clock_, swap.initiator_timelock)) {
      Count(Attempt("refund_initiator", swap.id, [&] { coordinator_->RefundInitiator(swap.id, true); }), stats.refunded, stats);
    }
  }

  if (options_.cancel_expired_offers) {
    for (const auto& swap : coordinator_->ListSwaps(db::SwapFilter::Open())) {
      if (htlc::IsExpired(*clock_, swap.acceptor_timelock)) {
        Count(Attempt("cancel", swap.id, [&] { coordinator_->CancelOffer(swap.id); }), stats.cancelled, stats);
      }
    }
  }

  return stats;
}

} // namespace atomicswap::monitor
