#pragma once

#include <string>
#include <string_view>

namespace atomicswap::runtime::config {
class ObservabilityConfig;
}

namespace atomicswap::observability {

inline constexpr std::string_view kInstrumentationName    = "atomicswapd";
inline constexpr std::string_view kInstrumentationVersion = "0.1.0";

// Destination of one OTLP signal ("traces" or "metrics").
struct OtlpTarget {
  std::string endpoint;
  bool        http{false};
  bool        insecure{true};
};

// Endpoint order: config otlp_endpoint, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the local collector port for the transport.
OtlpTarget ResolveOtlpTarget(const atomicswap::runtime::config::ObservabilityConfig& config, std::string_view signal);

// OTEL_SERVICE_NAME when set, otherwise the daemon name.
std::string ServiceName();

} // namespace atomicswap::observability
