#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace gallery::runtime::config {
class LoggingConfig;
}

namespace gallery::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the "gallery" logger as the spdlog default.

  Until this runs, messages go to spdlog's built-in default logger,
  so library code can log before the runtime is configured.
*/
void InitializeLogging(const gallery::runtime::config::LoggingConfig& config);
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

} // namespace gallery::observability

#define GALLERY_LOG_INFO(message, ...) ::gallery::observability::LogInfo((message), ##__VA_ARGS__)
#define GALLERY_LOG_WARN(message, ...) ::gallery::observability::LogWarn((message), ##__VA_ARGS__)
#define GALLERY_LOG_ERROR(message, ...) ::gallery::observability::LogError((message), ##__VA_ARGS__)
