#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace bolt::runtime::config {
class RuntimeConfig;
}

namespace bolt::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const bolt::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

// Level of an lnd log line, taken from its [ERR]/[WRN]/[INF]/[DBG]/[TRC] tag.
// Untagged lines (panics, usage errors) count as info.
spdlog::level::level_enum NodeOutputLevel(std::string_view line);

// Forwards one line of local node output to the "lnd" logger.
void LogNodeOutput(std::string_view line);

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

} // namespace bolt::observability

#define BOLT_LOG_DEBUG(message, ...) ::bolt::observability::LogDebug((message), ##__VA_ARGS__)
#define BOLT_LOG_INFO(message, ...) ::bolt::observability::LogInfo((message), ##__VA_ARGS__)
#define BOLT_LOG_WARN(message, ...) ::bolt::observability::LogWarn((message), ##__VA_ARGS__)
#define BOLT_LOG_ERROR(message, ...) ::bolt::observability::LogError((message), ##__VA_ARGS__)
