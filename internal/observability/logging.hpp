#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace nove::runtime::config {
class RuntimeConfig;
}

namespace nove::observability {

/*
  key=value pair appended to a log line.

  Values containing whitespace, quotes or '=' are quoted on output so
  request paths and error texts stay parseable.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DurationMsField(std::string_view key, double milliseconds);

void InitializeLogging(const nove::runtime::config::RuntimeConfig& config);
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

} // namespace nove::observability

#define NOVE_LOG_INFO(message, ...) ::nove::observability::LogInfo((message), ##__VA_ARGS__)
#define NOVE_LOG_WARN(message, ...) ::nove::observability::LogWarn((message), ##__VA_ARGS__)
#define NOVE_LOG_ERROR(message, ...) ::nove::observability::LogError((message), ##__VA_ARGS__)
