#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace releasectl::runtime::config {
class RuntimeConfig;
}

namespace releasectl::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::nanoseconds value);

/*
  Installs the process-wide default logger.

  Level, pattern, format and trace context come from RELEASECTL_LOG_* env
  vars first, then from config.logging. Text records render fields as
  logfmt; JSON records carry them as top-level string members.
*/
void InitializeLogging(const releasectl::runtime::config::RuntimeConfig& config);
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

} // namespace releasectl::observability

#define RELEASECTL_LOG_DEBUG(message, ...) ::releasectl::observability::LogDebug((message), ##__VA_ARGS__)
#define RELEASECTL_LOG_INFO(message, ...) ::releasectl::observability::LogInfo((message), ##__VA_ARGS__)
#define RELEASECTL_LOG_WARN(message, ...) ::releasectl::observability::LogWarn((message), ##__VA_ARGS__)
#define RELEASECTL_LOG_ERROR(message, ...) ::releasectl::observability::LogError((message), ##__VA_ARGS__)
