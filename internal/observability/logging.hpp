#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace booking::runtime::config {
class RuntimeConfig;
}

namespace booking::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// "-12.50USD"
LogField MoneyField(std::string_view key, std::int64_t cents, std::string_view currency);
// UTC, millisecond precision. Zero renders as "unset".
LogField InstantField(std::string_view key, std::uint64_t unix_ms);

// BOOKING_LOG_LEVEL, BOOKING_LOG_PATTERN and BOOKING_LOG_INCLUDE_TRACE_CONTEXT override the config.
void InitializeLogging(const booking::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace booking::observability

#define BOOKING_LOG_DEBUG(message, ...) ::booking::observability::LogDebug((message), ##__VA_ARGS__)
#define BOOKING_LOG_INFO(message, ...) ::booking::observability::LogInfo((message), ##__VA_ARGS__)
#define BOOKING_LOG_WARN(message, ...) ::booking::observability::LogWarn((message), ##__VA_ARGS__)
#define BOOKING_LOG_ERROR(message, ...) ::booking::observability::LogError((message), ##__VA_ARGS__)
