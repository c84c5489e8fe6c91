#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace bolt::process {

enum class SyncPhase : std::uint8_t {
  kNotStarted,
  kWaiting,
  kInProgress,
  kComplete,
};

enum class NodeEventType : std::uint8_t {
  kSyncWaiting,
  kSyncStarted,
  kSyncFinished,
  kLocalBlockHeight,
  kRemoteBlockHeight,
  kCompactFilterHeight,
  kUnlockerReady,
  kLightningReady,
  kProcessError,
  kProcessExited,
};

const char* ToString(NodeEventType type);

struct NodeEvent {
  NodeEventType type = NodeEventType::kProcessError;
  // Supervisor start this event belongs to.
  std::uint64_t generation = 0;
  std::int64_t  height     = 0;
  std::string   detail;  // error text, or last error for kProcessExited
  int           exit_code = -1;
  int           signal    = 0;
};

using NodeEventSink = std::function<void(const NodeEvent&)>;

} // namespace bolt::process
