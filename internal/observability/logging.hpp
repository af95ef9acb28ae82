#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace ledger::runtime::config {
class RuntimeConfig;
}

namespace ledger::observability {

/*
  Structured logging for ledger-core on the "ledger-core" spdlog logger.

  A line is the message followed by key=value fields, e.g.

    slow lock acquisition resource=balance:u1:USDT acquisition_ms=1200

  Values holding spaces or quotes are quoted. With
  logging.include_trace_context (or LEDGER_LOG_INCLUDE_TRACE_CONTEXT=1)
  and an active span, trace_id and span_id are appended.

  LEDGER_LOG_LEVEL and LEDGER_LOG_PATTERN override the config file.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Safe to call again; the logger is rebuilt from the new config.
void InitializeLogging(const ledger::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace ledger::observability

#define LEDGER_LOG_INFO(message, ...) ::ledger::observability::LogInfo((message), ##__VA_ARGS__)
#define LEDGER_LOG_WARN(message, ...) ::ledger::observability::LogWarn((message), ##__VA_ARGS__)
#define LEDGER_LOG_ERROR(message, ...) ::ledger::observability::LogError((message), ##__VA_ARGS__)
