#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace forecast::runtime::config {
class RuntimeConfig;
}

namespace forecast::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Empty means info. Throws util::ConfigurationError for names spdlog does
// not know.
spdlog::level::level_enum ParseLogLevel(std::string_view name);

// "message key=value ..." as written to the log.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

void InitializeLogging(const forecast::runtime::config::RuntimeConfig& config);
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

} // namespace forecast::observability

#define FORECAST_LOG_INFO(message, ...) ::forecast::observability::LogInfo((message), ##__VA_ARGS__)
#define FORECAST_LOG_WARN(message, ...) ::forecast::observability::LogWarn((message), ##__VA_ARGS__)
#define FORECAST_LOG_ERROR(message, ...) ::forecast::observability::LogError((message), ##__VA_ARGS__)
