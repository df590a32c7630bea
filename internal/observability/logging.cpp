#include "internal/observability/logging.hpp"

#include <array>
#include <atomic>
#include <cstdlib>
#include <iterator>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/hex.hpp"

#ifdef ATOMICSWAP_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace atomicswap::observability {
namespace {

constexpr const char* kLoggerName     = "atomicswapd";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_trace_context{false};

// Environment first, then config, then the fallback.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') return value;
  return configured.empty() ? std::string(fallback) : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str answers off for names it does not know.
  return level == spdlog::level::off && name != "off" ? spdlog::level::info : level;
}

bool TraceContextRequested(const atomicswap::runtime::config::LoggingConfig& logging) {
  if (const char* flag = std::getenv("ATOMICSWAP_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(flag);
    return value == "1" || value == "true";
  }
  return logging.include_trace_context();
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendField(fmt::memory_buffer& line, const LogField& field) {
  fmt::format_to(std::back_inserter(line), " {}=", field.key);
  if (!NeedsQuoting(field.value)) {
    line.append(field.value.data(), field.value.data() + field.value.size());
    return;
  }
  line.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') line.push_back('\\');
    line.push_back(c);
  }
  line.push_back('"');
}

void AppendTraceContext(fmt::memory_buffer& line) {
#ifdef ATOMICSWAP_ENABLE_OTEL
  if (!g_trace_context.load(std::memory_order_relaxed)) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return;
  }
  const auto                     context = span->GetContext();
  std::array<std::uint8_t, 16> trace_id{};
  std::array<std::uint8_t, 8>  span_id{};
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  fmt::format_to(std::back_inserter(line), " trace_id={} span_id={}", util::ToHex(trace_id.data(), trace_id.size()),
                 util::ToHex(span_id.data(), span_id.size()));
#else
  (void)line;
#endif
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return LogField{std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return LogField{std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return LogField{std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const atomicswap::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(Setting("ATOMICSWAP_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(ParseLevel(Setting("ATOMICSWAP_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_trace_context = TraceContextRequested(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  fmt::memory_buffer line;
  line.append(message.data(), message.data() + message.size());
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace atomicswap::observability
