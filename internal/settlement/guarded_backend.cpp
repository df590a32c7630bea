#include "guarded_backend.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace atomicswap::settlement {

namespace {

// Thrown only inside this file so a deadline miss can be told apart from
// an Unavailable raised by the backend itself.
class DeadlineExceeded : public util::BackendUnavailable {
 public:
  using util::BackendUnavailable::BackendUnavailable;
};

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

GuardedBackend::GuardedBackend(std::shared_ptr<SettlementBackend> inner, CallPolicy policy)
    : inner_(std::move(inner)), policy_(policy), abandoned_(std::make_shared<std::atomic<std::uint32_t>>(0)) {
  if (!inner_) {
    throw std::invalid_argument("GuardedBackend: inner backend is null");
  }
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
  if (policy_.max_abandoned_calls == 0) {
    policy_.max_abandoned_calls = 1;
  }
}

std::chrono::milliseconds GuardedBackend::Backoff(std::uint32_t attempt) const {
  auto delay = policy_.initial_backoff;
  for (std::uint32_t i = 1; i < attempt && delay < policy_.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy_.max_backoff);
}

template <typename T>
T GuardedBackend::CallWithDeadline(std::function<T()> fn) {
  if (policy_.call_timeout.count() <= 0) {
    return fn();
  }
  if (abandoned_->load() >= policy_.max_abandoned_calls) {
    throw util::BackendUnavailable(inner_->Asset() + " backend has " + std::to_string(abandoned_->load()) +
                                   " calls still running past their deadline");
  }

  enum CallState : int { kRunning, kDone, kAbandoned };
  auto state  = std::make_shared<std::atomic<int>>(kRunning);
  auto task   = std::make_shared<std::packaged_task<T()>>(std::move(fn));
  auto future = task->get_future();

  // Whichever side moves the state second settles the abandoned count.
  std::thread([task, state, abandoned = abandoned_] {
    (*task)();
    if (state->exchange(kDone) == kAbandoned) {
      abandoned->fetch_sub(1);
    }
  }).detach();

  if (future.wait_for(policy_.call_timeout) == std::future_status::timeout) {
    abandoned_->fetch_add(1);
    if (state->exchange(kAbandoned) == kDone) {
      abandoned_->fetch_sub(1);
    }
    throw DeadlineExceeded(inner_->Asset() + " backend call timed out after " + std::to_string(policy_.call_timeout.count()) + "ms");
  }
  return future.get();
}

template <typename T>
T GuardedBackend::Call(std::string_view op, bool idempotent, std::function<T()> fn) {
  auto&       metrics = observability::Metrics::Instance();
  const auto& asset   = inner_->Asset();

  for (std::uint32_t attempt = 1;; ++attempt) {
    const auto start = std::chrono::steady_clock::now();
    try {
      T result = CallWithDeadline<T>(fn);
      metrics.RecordBackendCall(asset, op, "ok");
      metrics.ObserveBackendLatencyMs(asset, op, ElapsedMs(start));
      return result;
    } catch (const DeadlineExceeded&) {
      metrics.RecordBackendCall(asset, op, "timeout");
      metrics.ObserveBackendLatencyMs(asset, op, ElapsedMs(start));
      ATOMICSWAP_LOG_WARN("backend call timed out", {observability::StringField("asset", asset), observability::StringField("op", op),
                                                     observability::IntField("attempt", attempt)});
      if (!idempotent || attempt >= policy_.max_attempts) {
        throw;
      }
    } catch (const util::BackendUnavailable& e) {
      metrics.RecordBackendCall(asset, op, "unavailable");
      metrics.ObserveBackendLatencyMs(asset, op, ElapsedMs(start));
      ATOMICSWAP_LOG_WARN("backend unavailable", {observability::StringField("asset", asset), observability::StringField("op", op),
                                                  observability::IntField("attempt", attempt), observability::StringField("error", e.what())});
      if (attempt >= policy_.max_attempts) {
        throw;
      }
    } catch (const util::BackendRejected& e) {
      metrics.RecordBackendCall(asset, op, "rejected");
      metrics.ObserveBackendLatencyMs(asset, op, ElapsedMs(start));
      ATOMICSWAP_LOG_INFO("backend rejected call", {observability::StringField("asset", asset), observability::StringField("op", op),
                                                    observability::StringField("error", e.what())});
      throw;
    }

    std::this_thread::sleep_for(Backoff(attempt));
  }
}

std::string GuardedBackend::Lock(const LockRequest& request) {
  auto inner = inner_;
  return Call<std::string>("lock", false, [inner, request] { return inner->Lock(request); });
}

std::string GuardedBackend::Redeem(const std::string& lock_ref, const std::string& secret_hex) {
  auto inner = inner_;
  return Call<std::string>("redeem", false, [inner, lock_ref, secret_hex] { return inner->Redeem(lock_ref, secret_hex); });
}

std::string GuardedBackend::Refund(const std::string& lock_ref) {
  auto inner = inner_;
  return Call<std::string>("refund", false, [inner, lock_ref] { return inner->Refund(lock_ref); });
}

model::Amount GuardedBackend::Balance() {
  auto inner = inner_;
  return Call<model::Amount>("balance", true, [inner] { return inner->Balance(); });
}

} // namespace atomicswap::settlement
