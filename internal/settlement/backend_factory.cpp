#include "backend_factory.hpp"

#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/duration.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "simulated/simulated_ledger.hpp"

namespace atomicswap::settlement {

CallPolicy BackendFactory::PolicyFrom(const atomicswap::runtime::config::BackendConfig& cfg) {
  CallPolicy policy;
  policy.call_timeout    = util::ParseDurationOr(cfg.call_timeout(), config::defaults::kCallTimeout);
  policy.max_attempts    = cfg.retry().max_attempts() == 0 ? config::defaults::kMaxAttempts : cfg.retry().max_attempts();
  policy.initial_backoff = util::ParseDurationOr(cfg.retry().initial_backoff(), config::defaults::kInitialBackoff);
  policy.max_backoff     = util::ParseDurationOr(cfg.retry().max_backoff(), config::defaults::kMaxBackoff);
  if (cfg.max_abandoned_calls() != 0) {
    policy.max_abandoned_calls = cfg.max_abandoned_calls();
  }
  return policy;
}

BackendMap BackendFactory::Build(const google::protobuf::RepeatedPtrField<atomicswap::runtime::config::BackendConfig>& configs,
                                 std::shared_ptr<const util::Clock>                                                   clock) {
  BackendMap backends;

  for (const auto& cfg : configs) {
    const auto asset = util::ToLower(cfg.asset());
    if (asset.empty()) {
      throw std::runtime_error("backend asset is required");
    }

    std::shared_ptr<SettlementBackend> inner;
    switch (cfg.kind_case()) {
      case atomicswap::runtime::config::BackendConfig::kSimulated: {
        model::Amount balance;
        if (!cfg.simulated().initial_balance().empty()) {
          try {
            balance = model::Amount::Parse(cfg.simulated().initial_balance());
          } catch (const util::Validation& e) {
            throw std::runtime_error("backend " + asset + ": initial_balance: " + e.what());
          }
        }
        auto ledger = std::make_shared<simulated::SimulatedLedger>(asset, balance, clock);
        ledger->SetLatency(util::ParseDurationOr(cfg.simulated().latency(), std::chrono::milliseconds{0}));
        inner = std::move(ledger);
        break;
      }
      default:
        throw std::runtime_error("backend " + asset + ": no backend kind configured");
    }

    const auto policy = PolicyFrom(cfg);
    if (!backends.emplace(asset, std::make_shared<GuardedBackend>(std::move(inner), policy)).second) {
      throw std::runtime_error("duplicate backend for asset " + asset);
    }

    ATOMICSWAP_LOG_INFO("settlement backend ready", {observability::StringField("asset", asset),
                                                      observability::StringField("call_timeout", util::FormatDuration(policy.call_timeout)),
                                                      observability::IntField("max_attempts", policy.max_attempts)});
  }

  return backends;
}

} // namespace atomicswap::settlement
