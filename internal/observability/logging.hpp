#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace trailmap::runtime::config {
class RuntimeConfig;
}

namespace trailmap::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// comma separated, for id lists such as blockers or cycle members
LogField ListField(std::string_view key, const std::vector<std::string>& values);

void InitializeLogging(const trailmap::runtime::config::RuntimeConfig& config);

// Env overrides and defaults only, for tools that log before a config is loaded.
void InitializeDefaultLogging();
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

} // namespace trailmap::observability

#define TRAILMAP_LOG_INFO(message, ...) ::trailmap::observability::LogInfo((message), ##__VA_ARGS__)
#define TRAILMAP_LOG_WARN(message, ...) ::trailmap::observability::LogWarn((message), ##__VA_ARGS__)
#define TRAILMAP_LOG_ERROR(message, ...) ::trailmap::observability::LogError((message), ##__VA_ARGS__)
