#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

#include "internal/util/duration.hpp"
#include "internal/util/hex.hpp"

namespace atomicswap::config {
namespace {

using google::protobuf::Value;

[[noreturn]] void Invalid(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
}

// Plain scalars become bool or number when they look like one. Quoted scalars
// carry the non-specific "!" tag and always stay strings.
void FromScalar(const YAML::Node& node, Value& out) {
  const std::string& text = node.Scalar();
  if (node.Tag() != "!") {
    if (text == "true" || text == "false") {
      out.set_bool_value(text == "true");
      return;
    }
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (!text.empty() && end != nullptr && *end == '\0') {
      out.set_number_value(number);
      return;
    }
  }
  out.set_string_value(text);
}

void FromNode(const YAML::Node& node, Value& out) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      out.set_null_value(google::protobuf::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      FromScalar(node, out);
      return;
    case YAML::NodeType::Sequence: {
      auto& list = *out.mutable_list_value();
      for (const auto& item : node) {
        FromNode(item, *list.add_values());
      }
      return;
    }
    case YAML::NodeType::Map: {
      auto& fields = *out.mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        FromNode(entry.second, fields[entry.first.as<std::string>()]);
      }
      return;
    }
  }
}

std::string ToJson(const YAML::Node& root) {
  Value value;
  FromNode(root, value);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(value, &json); !status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }
  return json;
}

std::chrono::milliseconds DurationField(const std::string& field, const std::string& text, std::chrono::milliseconds fallback) {
  try {
    return util::ParseDurationOr(text, fallback);
  } catch (const std::invalid_argument& e) {
    Invalid(field + ": " + e.what());
  }
}

void ValidateBackend(const atomicswap::runtime::config::BackendConfig& backend, std::set<std::string>& seen) {
  const auto asset = util::ToLower(backend.asset());
  if (asset.empty()) {
    Invalid("backends[].asset is required");
  }
  if (!seen.insert(asset).second) {
    Invalid("duplicate backend for asset '" + asset + "'");
  }
  if (!backend.has_simulated()) {
    Invalid("backend '" + asset + "' has no settlement kind");
  }

  const std::string prefix = "backends[" + asset + "].";
  DurationField(prefix + "call_timeout", backend.call_timeout(), defaults::kCallTimeout);
  DurationField(prefix + "retry.initial_backoff", backend.retry().initial_backoff(), defaults::kInitialBackoff);
  DurationField(prefix + "retry.max_backoff", backend.retry().max_backoff(), defaults::kMaxBackoff);
  DurationField(prefix + "simulated.latency", backend.simulated().latency(), std::chrono::milliseconds::zero());
}

} // namespace

atomicswap::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  atomicswap::runtime::config::RuntimeConfig config;
  if (auto status = google::protobuf::util::JsonStringToMessage(ToJson(root), &config, options); !status.ok()) {
    Invalid(std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const atomicswap::runtime::config::RuntimeConfig& config) {
  const auto& swap      = config.swap();
  const auto  initiator = DurationField("swap.initiator_timelock", swap.initiator_timelock(), defaults::kInitiatorTimelock);
  const auto  acceptor  = DurationField("swap.acceptor_timelock", swap.acceptor_timelock(), defaults::kAcceptorTimelock);
  if (acceptor <= std::chrono::milliseconds::zero()) {
    Invalid("swap.acceptor_timelock must be positive");
  }
  if (initiator % std::chrono::seconds(1) != std::chrono::milliseconds::zero() ||
      acceptor % std::chrono::seconds(1) != std::chrono::milliseconds::zero()) {
    Invalid("swap timelocks must be whole seconds");
  }
  if (acceptor >= initiator) {
    Invalid("swap.acceptor_timelock must be shorter than swap.initiator_timelock");
  }

  std::set<std::string> assets;
  for (const auto& backend : config.backends()) {
    ValidateBackend(backend, assets);
  }

  DurationField("monitor.interval", config.monitor().interval(), defaults::kMonitorInterval);
}

} // namespace atomicswap::config
