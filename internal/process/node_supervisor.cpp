#include "node_supervisor.hpp"

#include <signal.h>

#include <cerrno>
#include <system_error>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bolt::process {

using bolt::observability::IntField;
using bolt::observability::StringField;

const char* ToString(ShutdownOutcome outcome) {
  switch (outcome) {
    case ShutdownOutcome::kNotRunning:
      return "not_running";
    case ShutdownOutcome::kGraceful:
      return "graceful";
    case ShutdownOutcome::kForceKilled:
      return "force_killed";
  }
  return "unknown";
}

LaunchSpec BuildLndCommand(const bolt::runtime::config::LndConfig& config, const profile::ConnectionProfile& profile) {
  const auto  wallet_dir = profile.WalletDir(config.lnd_dir());
  const auto& currency   = profile.Currency();

  LaunchSpec spec;
  spec.binary      = config.binary_path();
  spec.working_dir = wallet_dir;

  spec.args.push_back("--lnddir=" + wallet_dir.string());
  spec.args.push_back("--rpclisten=" + config.rpc_listen());
  spec.args.push_back("--" + currency + ".active");
  spec.args.push_back("--" + currency + "." + profile.Network());
  spec.args.push_back("--" + currency + ".node=neutrino");
  for (const auto& peer : config.neutrino_peers()) {
    spec.args.push_back("--neutrino.connect=" + peer);
  }
  if (profile.Autopilot()) {
    spec.args.push_back("--autopilot.active");
  }
  if (const auto& alias = profile.Setting("alias"); !alias.empty()) {
    spec.args.push_back("--alias=" + alias);
  }
  for (const auto& arg : config.extra_args()) {
    spec.args.push_back(arg);
  }
  return spec;
}

LndSupervisor::LndSupervisor(CommandBuilder builder) : builder_(std::move(builder)) {
}

LndSupervisor::~LndSupervisor() {
  std::unique_ptr<ChildProcess> child;
  {
    std::lock_guard lock(mutex_);
    ++generation_;
    child = std::move(child_);
  }
  // ChildProcess kills a running child on destruction.
  child.reset();
  ReapRetired();
}

std::uint64_t LndSupervisor::Start(const profile::ConnectionProfile& profile, NodeEventSink sink) {
  if (!profile.IsLocal()) {
    throw util::InvalidState("only local connection profiles can be started");
  }

  // Reap previously signalled children outside the lock; their exit
  // handlers take it.
  ReapRetired();

  std::lock_guard lock(mutex_);
  if (child_ && child_->Running()) {
    throw util::InvalidState("node process is already running");
  }
  if (child_) {
    retired_.push_back(std::move(child_));
  }

  auto spec = builder_(profile);
  if (!spec.working_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(spec.working_dir, ec);
    if (ec) {
      throw util::SpawnError("failed to create " + spec.working_dir.string() + ": " + ec.message());
    }
  }

  const auto generation = ++generation_;
  parser_               = LndLogParser();
  sink_                 = std::move(sink);

  child_ = ChildProcess::Spawn(
      spec, [this, generation](const std::string& line) { OnLine(generation, line); },
      [this, generation](const ExitStatus& status) { OnExit(generation, status); });

  BOLT_LOG_INFO("Started node process", {StringField("binary", spec.binary), IntField("pid", child_->Pid()),
                                         IntField("generation", static_cast<std::int64_t>(generation))});
  return generation;
}

bool LndSupervisor::Active() const {
  std::lock_guard lock(mutex_);
  return child_ && child_->Running();
}

ShutdownOutcome LndSupervisor::Shutdown(std::chrono::milliseconds timeout) {
  std::unique_ptr<ChildProcess> child;
  {
    std::lock_guard lock(mutex_);
    // Exit events of a child we are stopping on purpose are not reported.
    ++generation_;
    child = std::move(child_);
  }

  if (!child || !child->Running()) {
    if (child) {
      std::lock_guard lock(mutex_);
      retired_.push_back(std::move(child));
    }
    return ShutdownOutcome::kNotRunning;
  }

  const auto pid = child->Pid();
  BOLT_LOG_INFO("Shutting down node process", {IntField("pid", pid), IntField("timeout_ms", timeout.count())});

  child->Signal(SIGINT);

  if (const auto status = child->WaitForExit(timeout)) {
    BOLT_LOG_INFO("Node process exited", {IntField("pid", pid), IntField("code", status->code), IntField("signal", status->signal)});
    child.reset();
    return ShutdownOutcome::kGraceful;
  }

  BOLT_LOG_WARN("Node process did not exit in time, killing", {IntField("pid", pid), IntField("timeout_ms", timeout.count())});
  child->Signal(SIGKILL);

  std::lock_guard lock(mutex_);
  retired_.push_back(std::move(child));
  return ShutdownOutcome::kForceKilled;
}

void LndSupervisor::Kill(int signal) {
  NodeEventSink sink;
  NodeEvent     event;
  {
    std::lock_guard lock(mutex_);
    if (!child_) {
      return;
    }
    if (child_->Signal(signal)) {
      return;
    }
    const int err = errno;
    if (!child_->Running()) {
      return;
    }
    sink             = sink_;
    event.type       = NodeEventType::kProcessError;
    event.generation = generation_;
    event.detail     = "failed to signal node process: " + std::system_category().message(err);
  }
  Emit(sink, {event});
}

SyncPhase LndSupervisor::Phase() const {
  std::lock_guard lock(mutex_);
  return parser_.Phase();
}

std::string LndSupervisor::LastError() const {
  std::lock_guard lock(mutex_);
  return parser_.LastError();
}

// Runs on a reader thread; nothing may escape it.
void LndSupervisor::OnLine(std::uint64_t generation, const std::string& line) {
  try {
    NodeEventSink          sink;
    std::vector<NodeEvent> events;
    {
      std::lock_guard lock(mutex_);
      if (generation != generation_) {
        return;
      }
      observability::LogNodeOutput(line);
      events = parser_.Parse(line);
      for (auto& event : events) {
        event.generation = generation;
      }
      sink = sink_;
    }
    Emit(sink, std::move(events));
  } catch (const std::exception& e) {
    BOLT_LOG_ERROR("Failed to handle node output", {StringField("line", line), StringField("error", e.what())});
  }
}

void LndSupervisor::OnExit(std::uint64_t generation, const ExitStatus& status) {
  NodeEventSink sink;
  NodeEvent     event;
  {
    std::lock_guard lock(mutex_);
    if (generation != generation_) {
      return;
    }
    // The child object cannot be destroyed from its own reaper thread.
    if (child_) {
      retired_.push_back(std::move(child_));
    }
    event.type       = NodeEventType::kProcessExited;
    event.generation = generation;
    event.exit_code  = status.code;
    event.signal     = status.signal;
    event.detail     = parser_.LastError();
    sink             = sink_;
  }

  BOLT_LOG_WARN("Node process exited unexpectedly",
                {IntField("code", status.code), IntField("signal", status.signal), StringField("last_error", event.detail)});
  Emit(sink, {event});
}

void LndSupervisor::Emit(const NodeEventSink& sink, std::vector<NodeEvent> events) {
  if (!sink) {
    return;
  }
  for (const auto& event : events) {
    BOLT_LOG_DEBUG("Node event", {StringField("event", ToString(event.type)), IntField("height", event.height)});
    sink(event);
  }
}

void LndSupervisor::ReapRetired() {
  std::vector<std::unique_ptr<ChildProcess>> retired;
  {
    std::lock_guard lock(mutex_);
    retired.swap(retired_);
  }
  // Destroying them joins their reaper threads.
  retired.clear();
}

} // namespace bolt::process
