#pragma once

#include <memory>

namespace atomicswap::core {
class SwapCoordinator;
}
namespace atomicswap::db {
class Repository;
}

namespace atomicswap::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<atomicswap::core::SwapCoordinator> coordinator;
  std::shared_ptr<atomicswap::db::Repository>        repository;
};

} // namespace atomicswap::service
