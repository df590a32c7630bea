#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace atomicswap::runtime::config {
class RuntimeConfig;
}

namespace atomicswap::observability {

// One key=value pair appended to a log line. Values with spaces, quotes or '='
// are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the "atomicswapd" console logger as the spdlog default.
// ATOMICSWAP_LOG_LEVEL, ATOMICSWAP_LOG_PATTERN and
// ATOMICSWAP_LOG_INCLUDE_TRACE_CONTEXT override the logging section.
void InitializeLogging(const atomicswap::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) { Log(spdlog::level::debug, message, fields); }
inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) { Log(spdlog::level::info, message, fields); }
inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) { Log(spdlog::level::warn, message, fields); }
inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) { Log(spdlog::level::err, message, fields); }

} // namespace atomicswap::observability

#define ATOMICSWAP_LOG_DEBUG(message, ...) ::atomicswap::observability::LogDebug((message), ##__VA_ARGS__)
#define ATOMICSWAP_LOG_INFO(message, ...) ::atomicswap::observability::LogInfo((message), ##__VA_ARGS__)
#define ATOMICSWAP_LOG_WARN(message, ...) ::atomicswap::observability::LogWarn((message), ##__VA_ARGS__)
#define ATOMICSWAP_LOG_ERROR(message, ...) ::atomicswap::observability::LogError((message), ##__VA_ARGS__)
