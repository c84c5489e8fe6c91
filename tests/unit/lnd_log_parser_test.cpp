#include "internal/process/lnd_log_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using bolt::process::LndLogParser;
using bolt::process::NodeEventType;
using bolt::process::SyncPhase;

void TestSyncProgressionIsReportedOnce() {
  LndLogParser parser;

  auto events = parser.Parse("2024-01-01 [INF] LNWL: Waiting for chain backend to finish sync, start_height=0");
  assert(events.size() == 1 && events[0].type == NodeEventType::kSyncWaiting);
  assert(parser.Phase() == SyncPhase::kWaiting);

  assert(parser.Parse("2024-01-01 [INF] LNWL: Waiting for chain backend to finish sync, start_height=0").empty());

  events = parser.Parse("2024-01-01 [INF] BTCN: Syncing to block height 2500000 from peer 1.2.3.4:18333");
  assert(events.size() == 2);
  assert(events[0].type == NodeEventType::kSyncStarted);
  assert(events[1].type == NodeEventType::kRemoteBlockHeight && events[1].height == 2500000);
  assert(parser.Phase() == SyncPhase::kInProgress);

  events = parser.Parse("2024-01-01 [INF] BTCN: Syncing to block height 2500001 from peer 1.2.3.4:18333");
  assert(events.size() == 1 && events[0].type == NodeEventType::kRemoteBlockHeight);

  // "waiting" again mid-sync never steps backwards.
  assert(parser.Parse("2024-01-01 [INF] LNWL: Waiting for chain backend to finish sync").empty());

  events = parser.Parse("2024-01-01 [INF] LNWL: Chain backend is fully synced (end_height=2500001)!");
  assert(events.size() == 1 && events[0].type == NodeEventType::kSyncFinished);
  assert(parser.Phase() == SyncPhase::kComplete);

  assert(parser.Parse("2024-01-01 [INF] LNWL: Chain backend is fully synced (end_height=2500001)!").empty());
}

void TestHeightEvents() {
  LndLogParser parser;

  auto events = parser.Parse("2024-01-01 [INF] LNWL: Caught up to height 1200");
  assert(events.size() == 1 && events[0].type == NodeEventType::kLocalBlockHeight && events[0].height == 1200);

  events = parser.Parse("2024-01-01 [INF] BTCN: Processed 5 blocks in the last 10.01s (height 1205, 2024-01-01 00:00:00)");
  assert(events.size() == 1 && events[0].type == NodeEventType::kLocalBlockHeight && events[0].height == 1205);

  events = parser.Parse("2024-01-01 [INF] BTCN: Got cfheaders from height=1001 to height=3000, prev_hash=abc");
  assert(events.size() == 1 && events[0].type == NodeEventType::kCompactFilterHeight && events[0].height == 3000);

  events = parser.Parse("2024-01-01 [INF] BTCN: Verified 2000 filter headers in the last 10s (height 5000, 2024-01-01)");
  assert(events.size() == 1 && events[0].type == NodeEventType::kCompactFilterHeight && events[0].height == 5000);

  parser.Parse("2024-01-01 [INF] LNWL: Chain backend is fully synced");
  assert(parser.Parse("2024-01-01 [INF] LNWL: Caught up to height 1300").empty());
  assert(parser.Parse("2024-01-01 [INF] BTCN: Syncing to block height 2500002 from peer x").empty());
}

void TestOversizedHeightIsDropped() {
  LndLogParser parser;

  auto events = parser.Parse("2024-01-01 [INF] BTCN: Syncing to block height 99999999999999999999999 from peer x");
  assert(events.size() == 1 && events[0].type == NodeEventType::kSyncStarted);

  assert(parser.Parse("2024-01-01 [INF] LNWL: Caught up to height 99999999999999999999999").empty());

  events = parser.Parse("2024-01-01 [INF] LNWL: Caught up to height 1400");
  assert(events.size() == 1 && events[0].height == 1400);
}

void TestRescanStartsSync() {
  LndLogParser parser;
  auto         events = parser.Parse("2024-01-01 [INF] LNWL: Starting rescan from block 00000000abc (height 100)");
  assert(events.size() == 1 && events[0].type == NodeEventType::kSyncStarted);
}

void TestProxyStartSelectsInterface() {
  LndLogParser parser;

  auto events = parser.Parse("2024-01-01 [INF] LTND: Waiting for wallet encryption password. Use `lncli create` ... gRPC proxy started");
  assert(events.size() == 1 && events[0].type == NodeEventType::kUnlockerReady);

  events = parser.Parse("2024-01-01 [INF] RPCS: gRPC proxy started at 127.0.0.1:8080");
  assert(events.size() == 1 && events[0].type == NodeEventType::kLightningReady);
}

void TestErrorLinesUpdateLastError() {
  LndLogParser parser;
  assert(parser.LastError().empty());

  const std::string line = "2024-01-01 [ERR] LTND: unable to open database";
  assert(parser.Parse(line).empty());
  assert(parser.LastError() == line);

  assert(parser.Parse("2024-01-01 [INF] LTND: shutdown complete").empty());
  assert(parser.LastError() == line);
}

void TestUnrelatedLinesProduceNothing() {
  LndLogParser parser;
  assert(parser.Parse("").empty());
  assert(parser.Parse("2024-01-01 [INF] LTND: Version: 0.17.0-beta").empty());
  assert(parser.Phase() == SyncPhase::kNotStarted);
}

} // namespace

int main() {
  TestSyncProgressionIsReportedOnce();
  TestHeightEvents();
  TestOversizedHeightIsDropped();
  TestRescanStartsSync();
  TestProxyStartSelectsInterface();
  TestErrorLinesUpdateLastError();
  TestUnrelatedLinesProduceNothing();

  std::cout << "bolt_controller_unit_lnd_log_parser: pass\n";
  return 0;
}
