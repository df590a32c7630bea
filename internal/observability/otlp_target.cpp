#include "internal/observability/otlp_target.hpp"

#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace atomicswap::observability {
namespace {

const char* NonEmptyEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  return value != nullptr && *value != '\0' ? value : nullptr;
}

std::string SignalEnvName(std::string_view signal) {
  std::string name = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  return name + "_ENDPOINT";
}

} // namespace

OtlpTarget ResolveOtlpTarget(const atomicswap::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  OtlpTarget target;
  target.http = config.transport() == atomicswap::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* env = NonEmptyEnv(SignalEnvName(signal))) {
    target.endpoint = env;
  } else if (const char* shared = NonEmptyEnv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = shared;
  } else if (target.http) {
    target.endpoint = "http://localhost:4318/v1/" + std::string(signal);
  } else {
    target.endpoint = "localhost:4317";
  }

  // An explicit https scheme asks for TLS on the grpc channel.
  target.insecure = target.endpoint.rfind("https://", 0) != 0;
  return target;
}

std::string ServiceName() {
  if (const char* name = NonEmptyEnv("OTEL_SERVICE_NAME")) return name;
  return std::string(kInstrumentationName);
}

} // namespace atomicswap::observability
