#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "child_process.hpp"
#include "internal/profile/connection_profile.hpp"
#include "lnd_log_parser.hpp"
#include "node_events.hpp"

namespace bolt::runtime::config {
class LndConfig;
}

namespace bolt::process {

enum class ShutdownOutcome : std::uint8_t {
  kNotRunning,
  kGraceful,
  kForceKilled,
};

const char* ToString(ShutdownOutcome outcome);

/*
  Owns at most one local node process.
*/
class NodeSupervisor {
 public:
  virtual ~NodeSupervisor() = default;

  // Spawns the node and streams its events to `sink`. Returns the generation
  // stamped on those events. Throws InvalidState if a node is already active,
  // SpawnError if it cannot be started.
  virtual std::uint64_t Start(const profile::ConnectionProfile& profile, NodeEventSink sink) = 0;

  virtual bool Active() const = 0;

  // Interrupt, wait up to `timeout`, then force kill. Never throws.
  virtual ShutdownOutcome Shutdown(std::chrono::milliseconds timeout) = 0;

  virtual void Kill(int signal) = 0;
};

using CommandBuilder = std::function<LaunchSpec(const profile::ConnectionProfile& profile)>;

LaunchSpec BuildLndCommand(const bolt::runtime::config::LndConfig& config, const profile::ConnectionProfile& profile);

class LndSupervisor final : public NodeSupervisor {
 public:
  explicit LndSupervisor(CommandBuilder builder);
  ~LndSupervisor() override;

  std::uint64_t   Start(const profile::ConnectionProfile& profile, NodeEventSink sink) override;
  bool            Active() const override;
  ShutdownOutcome Shutdown(std::chrono::milliseconds timeout) override;
  void            Kill(int signal) override;

  SyncPhase   Phase() const;
  std::string LastError() const;

 private:
  void OnLine(std::uint64_t generation, const std::string& line);
  void OnExit(std::uint64_t generation, const ExitStatus& status);
  void Emit(const NodeEventSink& sink, std::vector<NodeEvent> events);

  // Joins children that were signalled or exited. Must not hold mutex_.
  void ReapRetired();

  CommandBuilder builder_;

  mutable std::mutex                         mutex_;
  std::unique_ptr<ChildProcess>              child_;
  std::vector<std::unique_ptr<ChildProcess>> retired_;
  NodeEventSink                              sink_;
  LndLogParser                               parser_;
  std::uint64_t                              generation_ = 0;
};

} // namespace bolt::process
