#include "internal/observability/spans.hpp"

#ifdef ATOMICSWAP_ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_target.hpp"

namespace atomicswap::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using TracingConfig = atomicswap::runtime::config::ObservabilityConfig::TracingConfig;

namespace {

struct TracingState {
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracingState& State() {
  static TracingState state;
  return state;
}

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = !target.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeSpanProcessor(const TracingConfig& tracing, std::unique_ptr<sdktrace::SpanExporter> exporter) {
  if (tracing.processor() == TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  // Zero leaves the SDK default in place.
  const auto&                         batch = tracing.batch();
  sdktrace::BatchSpanProcessorOptions options;
  if (batch.max_queue_size() != 0) options.max_queue_size = batch.max_queue_size();
  if (batch.max_export_batch_size() != 0) options.max_export_batch_size = batch.max_export_batch_size();
  if (batch.schedule_delay_ms() != 0) options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), options);
}

resource::Resource SwapResource() {
  const std::string            service = ServiceName();
  const std::string            version(kInstrumentationVersion);
  resource::ResourceAttributes attributes = {
      {"service.name", service}, {"service.namespace", "atomicswap"}, {"service.version", version}};
  return resource::Resource::Create(attributes);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> ActiveTracer() {
  auto& state = State();
  if (!state.tracer) {
    // Falls back to whatever provider is installed globally (the no-op one by default).
    if (auto global = trace_api::Provider::GetTracerProvider()) {
      state.tracer = global->GetTracer(std::string(kInstrumentationName), std::string(kInstrumentationVersion));
    }
  }
  return state.tracer;
}

} // namespace

bool InitializeTracing(const atomicswap::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto target    = ResolveOtlpTarget(observability, "traces");
  auto       processor = MakeSpanProcessor(observability.tracing(), MakeSpanExporter(target));

  auto& state    = State();
  state.provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), SwapResource()));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(state.provider));
  state.tracer = state.provider->GetTracer(std::string(kInstrumentationName), std::string(kInstrumentationVersion));
  return static_cast<bool>(state.tracer);
}

void ShutdownTracing() {
  auto& state = State();
  if (state.provider) {
    state.provider->ForceFlush();
    state.provider->Shutdown();
    state.provider.reset();
  }
  state.tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  trace_api::Span* Live() const { return span ? span.get() : nullptr; }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = ActiveTracer();
  if (!tracer) {
    return;
  }
  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  auto* span = impl_ ? impl_->Live() : nullptr;
  if (span == nullptr) {
    return;
  }
  span->AddEvent("exception", {{"exception.message", std::string(description)}});
  span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace atomicswap::observability

#endif
