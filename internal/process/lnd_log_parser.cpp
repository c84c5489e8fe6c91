#include "lnd_log_parser.hpp"

#include <charconv>
#include <regex>

namespace bolt::process {

const char* ToString(NodeEventType type) {
  switch (type) {
    case NodeEventType::kSyncWaiting:
      return "syncWaiting";
    case NodeEventType::kSyncStarted:
      return "syncStarted";
    case NodeEventType::kSyncFinished:
      return "syncFinished";
    case NodeEventType::kLocalBlockHeight:
      return "localBlockHeight";
    case NodeEventType::kRemoteBlockHeight:
      return "remoteBlockHeight";
    case NodeEventType::kCompactFilterHeight:
      return "compactFilterHeight";
    case NodeEventType::kUnlockerReady:
      return "unlockerReady";
    case NodeEventType::kLightningReady:
      return "lightningReady";
    case NodeEventType::kProcessError:
      return "processError";
    case NodeEventType::kProcessExited:
      return "processExited";
  }
  return "unknown";
}

namespace {

const std::regex kWaiting(
    "Waiting for chain backend to finish sync|No sync peer candidates available|Unable to synchronize wallet to chain");
const std::regex kSyncingTo(R"(Syncing to block height (\d+))");
const std::regex kRescanStart("Starting rescan from block");
const std::regex kLocalHeight(
    R"(Rescanned through block .*\(height (\d+)|Caught up to height (\d+)|Processed \d+ blocks? in the last .*\(height (\d+)|Fetching set of headers from tip \(height=(\d+)|Waiting for filter headers \(height=(\d+)\) to catch up)");
const std::regex kFilterHeight(R"(Got cfheaders from height=\d+ to height=(\d+)|Verified \d+ filter headers? in the .*\(height (\d+))");
const std::regex kFinished("Chain backend is fully synced");
const std::regex kProxyStarted("gRPC proxy started");
const std::regex kPassword("password");
const std::regex kErrorTag(R"(\[ERR\])");

// First non-empty capture group as a height. Out-of-range heights are
// dropped.
std::optional<std::int64_t> CapturedHeight(const std::smatch& match) {
  for (std::size_t i = 1; i < match.size(); ++i) {
    if (!match[i].matched) {
      continue;
    }
    const auto   digits = match[i].str();
    std::int64_t height = 0;
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), height);
    if (ec != std::errc() || end != digits.data() + digits.size()) {
      return std::nullopt;
    }
    return height;
  }
  return std::nullopt;
}

NodeEvent HeightEvent(NodeEventType type, std::int64_t height) {
  NodeEvent event;
  event.type   = type;
  event.height = height;
  return event;
}

} // namespace

void LndLogParser::EnterPhase(SyncPhase phase, NodeEventType type, std::vector<NodeEvent>* out) {
  if (phase_ == phase || phase_ == SyncPhase::kComplete) {
    return;
  }
  phase_ = phase;
  NodeEvent event;
  event.type = type;
  out->push_back(std::move(event));
}

std::vector<NodeEvent> LndLogParser::Parse(const std::string& line) {
  std::vector<NodeEvent> events;
  std::smatch            match;

  if (std::regex_search(line, kErrorTag)) {
    last_error_ = line;
  }

  if (std::regex_search(line, kProxyStarted)) {
    NodeEvent event;
    event.type = std::regex_search(line, kPassword) ? NodeEventType::kUnlockerReady : NodeEventType::kLightningReady;
    events.push_back(std::move(event));
    return events;
  }

  if (std::regex_search(line, kFinished)) {
    EnterPhase(SyncPhase::kComplete, NodeEventType::kSyncFinished, &events);
    return events;
  }

  if (std::regex_search(line, kWaiting)) {
    // lnd logs "waiting" again while syncing; never step backwards.
    if (phase_ == SyncPhase::kNotStarted) {
      EnterPhase(SyncPhase::kWaiting, NodeEventType::kSyncWaiting, &events);
    }
    return events;
  }

  if (phase_ == SyncPhase::kComplete) {
    return events;
  }

  if (std::regex_search(line, match, kSyncingTo)) {
    EnterPhase(SyncPhase::kInProgress, NodeEventType::kSyncStarted, &events);
    if (auto height = CapturedHeight(match)) {
      events.push_back(HeightEvent(NodeEventType::kRemoteBlockHeight, *height));
    }
    return events;
  }

  if (std::regex_search(line, kRescanStart)) {
    EnterPhase(SyncPhase::kInProgress, NodeEventType::kSyncStarted, &events);
    return events;
  }

  if (std::regex_search(line, match, kLocalHeight)) {
    if (auto height = CapturedHeight(match)) {
      events.push_back(HeightEvent(NodeEventType::kLocalBlockHeight, *height));
    }
    return events;
  }

  if (std::regex_search(line, match, kFilterHeight)) {
    if (auto height = CapturedHeight(match)) {
      events.push_back(HeightEvent(NodeEventType::kCompactFilterHeight, *height));
    }
    return events;
  }

  return events;
}

} // namespace bolt::process
