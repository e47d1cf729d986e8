#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace wfstore::observability {
namespace {

constexpr const char* kLoggerName     = "wfstore";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

struct LoggingSettings {
  std::string level;
  std::string pattern;
  bool        include_trace_context = false;
};

// environment wins over the config file, the config file over the default
std::string Resolve(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

LoggingSettings ResolveSettings(const wfstore::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LoggingSettings settings;
  settings.level                 = Resolve("WFSTORE_LOG_LEVEL", logging.level(), "info");
  settings.pattern               = Resolve("WFSTORE_LOG_PATTERN", logging.pattern(), kDefaultPattern);
  settings.include_trace_context = logging.include_trace_context();
  if (const char* include_trace = std::getenv("WFSTORE_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    settings.include_trace_context = value == "1" || value == "true";
  }
  return settings;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  return value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

/*
  " key=value", with the value quoted and escaped when it holds whitespace,
  quotes or '='. Driver messages ("database is locked", multi-line pqxx
  errors) stay one field.
*/
void AppendField(std::string& line, std::string_view key, std::string_view value) {
  line += ' ';
  line += key;
  line += '=';
  if (!NeedsQuoting(value)) {
    line += value;
    return;
  }

  line += '"';
  for (char c : value) {
    switch (c) {
      case '"':
        line += "\\\"";
        break;
      case '\\':
        line += "\\\\";
        break;
      case '\n':
        line += "\\n";
        break;
      case '\t':
        line += "\\t";
        break;
      default:
        line += c;
    }
  }
  line += '"';
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

// trace_id / span_id of the store operation span active on this thread
void AppendTraceContext(std::string& line) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(line, "trace_id", HexId(trace_bytes, sizeof(trace_bytes)));
  AppendField(line, "span_id", HexId(span_bytes, sizeof(span_bytes)));
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

void InitializeLogging(const wfstore::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(settings.pattern);

  // from_str maps anything it does not know to off
  auto level = spdlog::level::from_str(settings.level);
  const bool unknown_level = level == spdlog::level::off && settings.level != "off";
  if (unknown_level) {
    level = spdlog::level::info;
  }
  logger->set_level(level);

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context.store(settings.include_trace_context, std::memory_order_relaxed);

  if (unknown_level) {
    LogWarn("unknown log level, using info", {StringField("level", settings.level)});
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
    AppendField(line, field.key, field.value);
  }
#ifdef ENABLE_OTEL
  if (g_include_trace_context.load(std::memory_order_relaxed)) {
    AppendTraceContext(line);
  }
#endif

  spdlog::log(level, "{}", line);
}

} // namespace wfstore::observability
