#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <optional>
#include <string>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/nostd/span.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace ledger::observability {
namespace {

constexpr const char* kLoggerName     = "ledger-core";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_trace_context{false};

std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (!value || !*value) return std::nullopt;
  return std::string(value);
}

// Environment wins over the config file, which wins over the default.
std::string Pick(const char* env_name, const std::string& configured, const char* fallback) {
  if (auto value = Env(env_name)) return *value;
  return configured.empty() ? fallback : configured;
}

bool TraceContextWanted(const ledger::runtime::config::LoggingConfig& logging) {
  if (auto value = Env("LEDGER_LOG_INCLUDE_TRACE_CONTEXT")) {
    return *value == "1" || *value == "true";
  }
  return logging.include_trace_context();
}

// Quotes values carrying spaces so descriptions stay one field.
void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) out.push_back(' ');
  out.append(field.key);
  out.push_back('=');

  if (field.value.find_first_of(" \t\"=") == std::string::npos) {
    out.append(field.value);
    return;
  }
  out.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& out) {
  if (!g_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(opentelemetry::nostd::span<char, 32>(trace_id));
  context.span_id().ToLowerBase16(opentelemetry::nostd::span<char, 16>(span_id));

  AppendField(out, {"trace_id", std::string(trace_id, sizeof(trace_id))});
  AppendField(out, {"span_id", std::string(span_id, sizeof(span_id))});
}
#else
void AppendTraceContext(std::string&) {
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

void InitializeLogging(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  const auto level_name = Pick("LEDGER_LOG_LEVEL", logging.level(), kDefaultLevel);
  auto       level      = spdlog::level::from_str(level_name);
  const bool unknown    = level == spdlog::level::off && level_name != "off";
  if (unknown) level = spdlog::level::info;

  // Config reloads in tests call this more than once.
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(Pick("LEDGER_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);

  g_trace_context = TraceContextWanted(logging);

  if (unknown) {
    LogWarn("Unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::default_logger_raw()->should_log(level)) return;

  std::string suffix;
  for (const auto& field : fields) {
    AppendField(suffix, field);
  }
  AppendTraceContext(suffix);

  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, suffix);
  }
}

} // namespace ledger::observability
