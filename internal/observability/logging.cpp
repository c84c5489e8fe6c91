#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace bolt::observability {
namespace {

std::string ResolveLevel(const bolt::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("BOLT_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const bolt::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("BOLT_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string ResolveNodeLevel(const bolt::runtime::config::RuntimeConfig& config, const std::string& fallback) {
  if (const char* level = std::getenv("BOLT_NODE_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().node_level().empty()) {
    return config.logging().node_level();
  }

  return fallback;
}

constexpr const char* kNodeLoggerName = "lnd";

// Values carrying spaces (node output, error text) are quoted so the line
// still splits into key=value pairs.
void WriteValue(std::ostringstream& out, const std::string& value) {
  if (value.find_first_of(" \t\"") == std::string::npos && !value.empty()) {
    out << value;
    return;
  }
  out << '"';
  for (const char c : value) {
    if (c == '"' || c == '\\') {
      out << '\\';
    }
    out << c;
  }
  out << '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    WriteValue(out, field.value);
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const bolt::runtime::config::RuntimeConfig& config) {
  const auto pattern = ResolvePattern(config);
  const auto level   = ResolveLevel(config);

  auto logger = spdlog::stdout_color_mt("bolt-controller");
  logger->set_pattern(pattern);
  logger->set_level(spdlog::level::from_str(level));

  // Node output shares the controller's sinks under its own name and level.
  auto node_logger = std::make_shared<spdlog::logger>(kNodeLoggerName, logger->sinks().begin(), logger->sinks().end());
  node_logger->set_pattern(pattern);
  node_logger->set_level(spdlog::level::from_str(ResolveNodeLevel(config, level)));
  spdlog::register_logger(node_logger);

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

spdlog::level::level_enum NodeOutputLevel(std::string_view line) {
  if (line.find("[ERR]") != std::string_view::npos || line.find("[CRT]") != std::string_view::npos) {
    return spdlog::level::err;
  }
  if (line.find("[WRN]") != std::string_view::npos) {
    return spdlog::level::warn;
  }
  if (line.find("[DBG]") != std::string_view::npos || line.find("[TRC]") != std::string_view::npos) {
    return spdlog::level::debug;
  }
  return spdlog::level::info;
}

void LogNodeOutput(std::string_view line) {
  auto logger = spdlog::get(kNodeLoggerName);
  if (!logger) {
    logger = spdlog::default_logger();
  }
  logger->log(NodeOutputLevel(line), "{}", line);
}

} // namespace bolt::observability
