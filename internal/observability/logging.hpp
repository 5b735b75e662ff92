#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace kag::runtime::config {
class RuntimeConfig;
}

namespace kag::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

void InitializeLogging(const kag::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// "message key=value ..."; values with whitespace, quotes or '=' are quoted
// and escaped so one record stays on one line.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

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

} // namespace kag::observability

#define KAG_LOG_DEBUG(message, ...) ::kag::observability::LogDebug((message), ##__VA_ARGS__)
#define KAG_LOG_INFO(message, ...) ::kag::observability::LogInfo((message), ##__VA_ARGS__)
#define KAG_LOG_WARN(message, ...) ::kag::observability::LogWarn((message), ##__VA_ARGS__)
#define KAG_LOG_ERROR(message, ...) ::kag::observability::LogError((message), ##__VA_ARGS__)
