#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace atomicswap::config {

// Applied when the corresponding config string is empty.
namespace defaults {
inline constexpr std::chrono::milliseconds kInitiatorTimelock{24 * 60 * 60 * 1000};
inline constexpr std::chrono::milliseconds kAcceptorTimelock{12 * 60 * 60 * 1000};
inline constexpr std::chrono::milliseconds kCallTimeout{10 * 1000};
inline constexpr std::chrono::milliseconds kInitialBackoff{200};
inline constexpr std::chrono::milliseconds kMaxBackoff{2 * 1000};
inline constexpr std::chrono::milliseconds kMonitorInterval{30 * 1000};
inline constexpr std::uint32_t             kMaxAttempts = 3;
inline constexpr const char*               kBindAddress = "0.0.0.0:50071";
} // namespace defaults

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  errors. Quoted scalars always stay strings, so amounts such as "10" or
  durations such as "30" reach string fields intact.
*/
class ConfigLoader {
 public:
  static atomicswap::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Semantic checks the schema cannot express: durations parse, the
  // acceptor timelock is strictly shorter than the initiator's, backend
  // assets are unique. Throws std::runtime_error.
  static void Validate(const atomicswap::runtime::config::RuntimeConfig& config);
};

} // namespace atomicswap::config
