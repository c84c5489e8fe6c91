#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using bolt::observability::NodeOutputLevel;

void TestNodeOutputLevelFollowsLndTag() {
  assert(NodeOutputLevel("2024-01-01 12:00:00.000 [ERR] LTND: unable to open database") == spdlog::level::err);
  assert(NodeOutputLevel("2024-01-01 12:00:00.000 [CRT] LTND: shutting down") == spdlog::level::err);
  assert(NodeOutputLevel("2024-01-01 12:00:00.000 [WRN] BTCN: peer timed out") == spdlog::level::warn);
  assert(NodeOutputLevel("2024-01-01 12:00:00.000 [INF] LNWL: Caught up to height 1200") == spdlog::level::info);
  assert(NodeOutputLevel("2024-01-01 12:00:00.000 [DBG] PEER: received ping") == spdlog::level::debug);
  assert(NodeOutputLevel("2024-01-01 12:00:00.000 [TRC] PEER: wire bytes") == spdlog::level::debug);
  assert(NodeOutputLevel("panic: runtime error: index out of range") == spdlog::level::info);
}

void TestNodeOutputBeforeInitializationUsesDefaultLogger() {
  bolt::observability::LogNodeOutput("[INF] LTND: Version: 0.17.0-beta");
}

void TestNodeLoggerLevelIsConfiguredSeparately() {
  ::unsetenv("BOLT_LOG_LEVEL");
  ::unsetenv("BOLT_NODE_LOG_LEVEL");

  bolt::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  config.mutable_logging()->set_node_level("warn");

  bolt::observability::InitializeLogging(config);

  auto node_logger = spdlog::get("lnd");
  assert(node_logger != nullptr);
  assert(node_logger->level() == spdlog::level::warn);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);
  assert(!node_logger->should_log(spdlog::level::info));
  assert(node_logger->should_log(NodeOutputLevel("[ERR] LTND: unable to open database")));

  bolt::observability::LogNodeOutput("[ERR] LTND: unable to open database");
  BOLT_LOG_INFO("Node output forwarded", {bolt::observability::StringField("line", "value with \"quotes\" and spaces")});

  bolt::observability::ShutdownLogging();
}

} // namespace

int main() {
  TestNodeOutputLevelFollowsLndTag();
  TestNodeOutputBeforeInitializationUsesDefaultLogger();
  TestNodeLoggerLevelIsConfiguredSeparately();

  std::cout << "bolt_controller_unit_logging: pass\n";
  return 0;
}
