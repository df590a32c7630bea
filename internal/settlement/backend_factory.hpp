#pragma once

#include <memory>

#include "config/config.pb.h"
#include "guarded_backend.hpp"
#include "settlement_backend.hpp"

namespace atomicswap::settlement {

/*
  Builds one guarded backend per configured asset.

      auto backends = BackendFactory::Build(config.backends(), clock);
      backends.at("btc")->Lock(...)
*/
class BackendFactory {
 public:
  static BackendMap Build(const google::protobuf::RepeatedPtrField<atomicswap::runtime::config::BackendConfig>& configs,
                          std::shared_ptr<const util::Clock>                                                   clock);

  static CallPolicy PolicyFrom(const atomicswap::runtime::config::BackendConfig& cfg);
};

} // namespace atomicswap::settlement
