#pragma once

#include <optional>
#include <string>
#include <vector>

#include "node_events.hpp"

namespace bolt::process {

/*
  Turns lnd log lines into structured node events.

  Sync phase changes are reported once each. Height events are suppressed
  once the chain backend reports it is fully synced. Lines tagged [ERR]
  update LastError() without producing an event.
*/
class LndLogParser {
 public:
  std::vector<NodeEvent> Parse(const std::string& line);

  SyncPhase Phase() const {
    return phase_;
  }

  const std::string& LastError() const {
    return last_error_;
  }

 private:
  void EnterPhase(SyncPhase phase, NodeEventType type, std::vector<NodeEvent>* out);

  SyncPhase   phase_ = SyncPhase::kNotStarted;
  std::string last_error_;
};

} // namespace bolt::process
