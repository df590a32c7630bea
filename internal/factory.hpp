#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/clock.hpp"

namespace atomicswap::core {
class SwapCoordinator;
}
namespace atomicswap::monitor {
class RefundMonitor;
}

namespace atomicswap::factory {

/*
  Application

  Owns every long-lived object of the daemon. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<core::SwapCoordinator> coordinator;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // null when monitor.enabled is false
  std::shared_ptr<monitor::RefundMonitor> refund_monitor;
};

/*
  Composition root. The only place that knows concrete store and
  backend types. Background workers are built but not started.
*/
Application Build(const atomicswap::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::Clock> clock);

std::shared_ptr<db::Repository> BuildRepository(const atomicswap::runtime::config::DatabaseConfig& database);

} // namespace atomicswap::factory
