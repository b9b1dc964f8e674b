#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace linecheck::runtime::config {
class RuntimeConfig;
}

namespace linecheck::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern come from LINECHECK_LOG_LEVEL / LINECHECK_LOG_PATTERN,
// then the logging section, then info and an ISO-8601 pattern.
// Every record is tagged with line=<line.name> when a name is configured.
void InitializeLogging(const linecheck::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// "<message> key=value ..." with values quoted when they hold spaces, '=' or quotes.
std::string FormatLogRecord(std::string_view message, std::initializer_list<LogField> fields);

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

} // namespace linecheck::observability

#define LINECHECK_LOG_DEBUG(message, ...) ::linecheck::observability::LogDebug((message), ##__VA_ARGS__)
#define LINECHECK_LOG_INFO(message, ...) ::linecheck::observability::LogInfo((message), ##__VA_ARGS__)
#define LINECHECK_LOG_WARN(message, ...) ::linecheck::observability::LogWarn((message), ##__VA_ARGS__)
#define LINECHECK_LOG_ERROR(message, ...) ::linecheck::observability::LogError((message), ##__VA_ARGS__)
