#include "internal/observability/spans.hpp"

#ifdef ATOMICSWAP_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_target.hpp"

namespace atomicswap::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using Attribute  = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes = std::initializer_list<Attribute>;
using Counter    = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;
using Histogram  = opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>;

constexpr std::uint32_t kDefaultExportIntervalMs = 5000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Per-family switches from observability.metrics; request and refund metrics are always on.
std::atomic<bool> g_transitions_enabled{true};
std::atomic<bool> g_backend_enabled{true};

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = !target.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// Older SDKs take the reader as shared_ptr.
template <typename Provider>
void AttachReader(Provider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

// The context-taking overloads replaced the two-argument ones in newer API versions.
template <typename Instrument>
void Increment(const opentelemetry::nostd::shared_ptr<Instrument>& counter, Attributes attributes) {
  if (!counter) {
    return;
  }
  if constexpr (requires { counter->Add(std::uint64_t{1}, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(std::uint64_t{1}, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(std::uint64_t{1}, attributes);
  }
}

template <typename Instrument>
void Observe(const opentelemetry::nostd::shared_ptr<Instrument>& histogram, double value, Attributes attributes) {
  if (!histogram) {
    return;
  }
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  Counter   requests;
  Histogram request_latency;
  Counter   transitions;
  Counter   backend_calls;
  Histogram backend_latency;
  Counter   refunds;
};

bool InitializeMetrics(const atomicswap::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& settings = observability.metrics();

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = settings.collection_interval_ms() != 0 ? settings.collection_interval_ms() : kDefaultExportIntervalMs;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  if (settings.export_timeout_ms() != 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(settings.export_timeout_ms());
  }
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(
      MakeMetricExporter(ResolveOtlpTarget(observability, "metrics")), reader_options);

  const std::string            service = ServiceName();
  const std::string            version(kInstrumentationVersion);
  resource::ResourceAttributes attributes = {
      {"service.name", service}, {"service.namespace", "atomicswap"}, {"service.version", version}};

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attributes));
  AttachReader(*g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_transitions_enabled = settings.transition_metrics_enabled();
  g_backend_enabled     = settings.backend_metrics_enabled();
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(std::string(kInstrumentationName), std::string(kInstrumentationVersion));

  auto& meter            = *impl_->meter;
  impl_->requests        = meter.CreateUInt64Counter("atomicswap.request.count", "Coordinator RPCs handled", "1");
  impl_->request_latency = meter.CreateDoubleHistogram("atomicswap.request.latency_ms", "Coordinator RPC latency", "ms");
  impl_->transitions     = meter.CreateUInt64Counter("atomicswap.transition.count", "Swap state transition attempts", "1");
  impl_->backend_calls   = meter.CreateUInt64Counter("atomicswap.backend.call.count", "Settlement backend calls", "1");
  impl_->backend_latency = meter.CreateDoubleHistogram("atomicswap.backend.latency_ms", "Settlement backend call latency", "ms");
  impl_->refunds         = meter.CreateUInt64Counter("atomicswap.refund.count", "Refunded swap legs", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Increment(impl_->requests, {{"route", std::string(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Observe(impl_->request_latency, latency_ms, {{"route", std::string(route)}});
}

void Metrics::RecordTransition(std::string_view action, bool success) {
  if (g_transitions_enabled) {
    Increment(impl_->transitions, {{"action", std::string(action)}, {"success", success}});
  }
}

void Metrics::RecordBackendCall(std::string_view asset, std::string_view op, std::string_view outcome) {
  if (g_backend_enabled) {
    Increment(impl_->backend_calls, {{"asset", std::string(asset)}, {"op", std::string(op)}, {"outcome", std::string(outcome)}});
  }
}

void Metrics::ObserveBackendLatencyMs(std::string_view asset, std::string_view op, double latency_ms) {
  if (g_backend_enabled) {
    Observe(impl_->backend_latency, latency_ms, {{"asset", std::string(asset)}, {"op", std::string(op)}});
  }
}

void Metrics::RecordRefund(std::string_view leg, bool automatic) {
  Increment(impl_->refunds, {{"leg", std::string(leg)}, {"automatic", automatic}});
}

} // namespace atomicswap::observability

#endif
