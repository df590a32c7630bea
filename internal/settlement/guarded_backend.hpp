#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "settlement_backend.hpp"

namespace atomicswap::settlement {

struct CallPolicy {
  // zero disables the deadline
  std::chrono::milliseconds call_timeout{10000};

  std::uint32_t             max_attempts = 3;
  std::chrono::milliseconds initial_backoff{200};
  std::chrono::milliseconds max_backoff{2000};

  // Calls still running past their deadline. Once this many are
  // outstanding, new calls fail with BackendUnavailable without starting.
  std::uint32_t max_abandoned_calls = 4;
};

/*
  Wraps a backend with a per-call deadline, bounded retry and telemetry.

  Retry rules:
    - BackendUnavailable raised by the backend is retried with
      exponential backoff up to max_attempts.
    - BackendRejected is never retried.
    - A deadline miss surfaces as BackendUnavailable. It is retried only
      for Balance: a timed out Lock/Redeem/Refund may still land, so
      resubmitting could double spend.

  A call that misses its deadline keeps running on its worker thread. The
  worker holds only the inner backend and the shared abandoned counter.
*/
class GuardedBackend final : public SettlementBackend {
 public:
  GuardedBackend(std::shared_ptr<SettlementBackend> inner, CallPolicy policy);

  const std::string& Asset() const override {
    return inner_->Asset();
  }

  std::string   Lock(const LockRequest& request) override;
  std::string   Redeem(const std::string& lock_ref, const std::string& secret_hex) override;
  std::string   Refund(const std::string& lock_ref) override;
  model::Amount Balance() override;

  const CallPolicy& Policy() const {
    return policy_;
  }

  std::uint32_t AbandonedCalls() const {
    return abandoned_->load();
  }

 private:
  template <typename T>
  T Call(std::string_view op, bool idempotent, std::function<T()> fn);

  template <typename T>
  T CallWithDeadline(std::function<T()> fn);

  std::chrono::milliseconds Backoff(std::uint32_t attempt) const;

  std::shared_ptr<SettlementBackend>          inner_;
  CallPolicy                                  policy_;
  std::shared_ptr<std::atomic<std::uint32_t>> abandoned_;
};

} // namespace atomicswap::settlement
