#include "internal/observability/logging.hpp"

#include <chrono>
#include <cstdlib>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace booking::observability {
namespace {

constexpr const char* kLoggerName = "booking-engine";

std::string ResolveLevel(const booking::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("BOOKING_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const booking::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("BOOKING_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool ResolveTraceContextEnabled(const booking::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("BOOKING_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

// Free-text values (reasons, error messages) are quoted so every line
// still splits cleanly into key=value pairs.
void AppendField(std::string& line, const LogField& field) {
  line.push_back(' ');
  line.append(field.key);
  line.push_back('=');

  const bool quote = field.value.empty() || field.value.find_first_of(" =\"") != std::string::npos;
  if (!quote) {
    line.append(field.value);
    return;
  }
  line.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') {
      line.push_back('\\');
    }
    line.push_back(c);
  }
  line.push_back('"');
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  auto trace_id = context.trace_id();
  auto span_id  = context.span_id();
  if (trace_id.IsValid() && span_id.IsValid()) {
    uint8_t trace_bytes[16];
    uint8_t span_bytes[8];
    trace_id.CopyBytesTo(trace_bytes);
    span_id.CopyBytesTo(span_bytes);
    return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
  }
  return {};
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField MoneyField(std::string_view key, std::int64_t cents, std::string_view currency) {
  const auto whole = cents < 0 ? -(cents / 100) : cents / 100;
  const auto frac  = cents < 0 ? -(cents % 100) : cents % 100;
  return {std::string(key), fmt::format("{}{}.{:02}{}", cents < 0 ? "-" : "", whole, frac, currency)};
}

LogField InstantField(std::string_view key, std::uint64_t unix_ms) {
  if (unix_ms == 0) {
    return {std::string(key), "unset"};
  }
  using namespace std::chrono;
  const sys_time<milliseconds> tp{milliseconds(unix_ms)};
  const auto                   day = floor<days>(tp);
  const year_month_day         ymd{day};
  const hh_mm_ss               tod{tp - day};
  return {std::string(key), fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                                        static_cast<unsigned>(ymd.day()), tod.hours().count(), tod.minutes().count(), tod.seconds().count(),
                                        tod.subseconds().count())};
}

void InitializeLogging(const booking::runtime::config::RuntimeConfig& config) {
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(ResolvePattern(config));

  // from_str maps unknown names to "off", which would silence the engine.
  const auto level_name = ResolveLevel(config);
  auto       level      = spdlog::level::from_str(level_name);
  const bool known      = level != spdlog::level::off || level_name == "off";
  logger->set_level(known ? level : spdlog::level::info);

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);

  if (!known) {
    Log(spdlog::level::warn, "unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  const auto trace_fields = TraceContextFields();
  if (!trace_fields.empty()) {
    line.push_back(' ');
    line.append(trace_fields);
  }
  spdlog::log(level, "{}", line);
}

} // namespace booking::observability
