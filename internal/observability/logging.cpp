#include "internal/observability/logging.hpp"

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

namespace rvault::observability {
namespace {

constexpr const char* kLoggerName     = "rvault-reader";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LogSettings {
  std::string level;
  std::string pattern;
  bool include_trace_context = false;
};

// Environment first, then the config value, then the built-in default.
std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value && *value) return value;
  return configured.empty() ? fallback : configured;
}

LogSettings ResolveSettings(const rvault::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  settings.level   = EnvOr("RVAULT_LOG_LEVEL", logging.level(), kDefaultLevel);
  settings.pattern = EnvOr("RVAULT_LOG_PATTERN", logging.pattern(), kDefaultPattern);

  settings.include_trace_context = logging.include_trace_context();
  if (const char* flag = std::getenv("RVAULT_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(flag);
    settings.include_trace_context = value == "1" || value == "true";
  }
  return settings;
}

bool g_include_trace_context{false};

// Labels and error messages contain spaces; quote them so a line stays
// splittable on key=value pairs.
void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
    out += value;
    return;
  }
  out += '"';
  for (const char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);

  line += " trace_id=";
  line.append(trace_hex, sizeof(trace_hex));
  line += " span_id=";
  line.append(span_hex, sizeof(span_hex));
}
#else
void AppendTraceContext(std::string&) {}
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

LogField AddressField(std::string_view key, const chain::Address& address) {
  return {std::string(key), address.ShortForm()};
}

void InitializeLogging(const rvault::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  auto level = spdlog::level::from_str(settings.level);
  // from_str answers "off" for anything it does not recognize.
  const bool unknown_level = level == spdlog::level::off && settings.level != "off";
  if (unknown_level) level = spdlog::level::info;

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = settings.include_trace_context;

  if (unknown_level) {
    RVAULT_LOG_WARN("unknown log level, using info", {StringField("level", settings.level)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);

  logger->log(level, "{}", line);
}

} // namespace rvault::observability
