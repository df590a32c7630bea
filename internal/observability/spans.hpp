#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace atomicswap::runtime::config {
class RuntimeConfig;
}

namespace atomicswap::observability {

// Both return false when the signal is disabled in config. Re-initializing
// replaces the installed provider.
bool InitializeTracing(const atomicswap::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const atomicswap::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// RAII span made current for its lifetime. Inert until tracing is initialized.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ATOMICSWAP_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// Process-wide swap instruments. Calls are no-ops without a meter provider.
class Metrics {
 public:
  static Metrics& Instance();

  // route is the RPC name.
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // One per coordinator action attempt.
  void RecordTransition(std::string_view action, bool success);

  // outcome: ok, unavailable, rejected, timeout
  void RecordBackendCall(std::string_view asset, std::string_view op, std::string_view outcome);
  void ObserveBackendLatencyMs(std::string_view asset, std::string_view op, double latency_ms);

  // leg: initiator, acceptor
  void RecordRefund(std::string_view leg, bool automatic);

 private:
  Metrics();
#ifdef ATOMICSWAP_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ATOMICSWAP_ENABLE_OTEL
inline bool InitializeTracing(const atomicswap::runtime::config::RuntimeConfig&) { return false; }
inline bool InitializeMetrics(const atomicswap::runtime::config::RuntimeConfig&) { return false; }
inline void ShutdownTracing() {}
inline void ShutdownMetrics() {}
inline SpanScope::SpanScope(std::string_view) {}
inline SpanScope::~SpanScope() {}
inline SpanScope::SpanScope(SpanScope&&) noexcept = default;
inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;
inline void SpanScope::SetAttribute(std::string_view, std::string_view) {}
inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {}
inline void SpanScope::SetAttribute(std::string_view, double) {}
inline void SpanScope::AddEvent(std::string_view) {}
inline void SpanScope::RecordException(std::string_view) {}
inline Metrics::Metrics() {}
inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}
inline void Metrics::RecordRequest(std::string_view, bool) {}
inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {}
inline void Metrics::RecordTransition(std::string_view, bool) {}
inline void Metrics::RecordBackendCall(std::string_view, std::string_view, std::string_view) {}
inline void Metrics::ObserveBackendLatencyMs(std::string_view, std::string_view, double) {}
inline void Metrics::RecordRefund(std::string_view, bool) {}
#endif

} // namespace atomicswap::observability
