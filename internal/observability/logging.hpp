#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace vaultsync::runtime::config {
class LoggingConfig;
}

namespace vaultsync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UIntField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// key=value pairs separated by spaces; values with spaces, quotes or '=' are
// quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

// Binary name doubles as the logger name. VAULTSYNC_LOG_LEVEL overrides the
// configured level.
void InitializeLogging(const vaultsync::runtime::config::LoggingConfig& config, std::string_view logger_name);

void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace vaultsync::observability

#define VAULTSYNC_LOG_DEBUG(message, ...) ::vaultsync::observability::LogDebug((message), ##__VA_ARGS__)
#define VAULTSYNC_LOG_INFO(message, ...) ::vaultsync::observability::LogInfo((message), ##__VA_ARGS__)
#define VAULTSYNC_LOG_WARN(message, ...) ::vaultsync::observability::LogWarn((message), ##__VA_ARGS__)
#define VAULTSYNC_LOG_ERROR(message, ...) ::vaultsync::observability::LogError((message), ##__VA_ARGS__)
