#include "state_machine.hpp"

namespace bolt::coordinator {

std::optional<Transition> FindTransition(LifecycleState from, Trigger trigger) {
  if (IsTerminal(from)) {
    return std::nullopt;
  }

  const bool leaving_running = from == LifecycleState::kRunning;

  switch (trigger) {
    case Trigger::kStartOnboarding: {
      Transition t{LifecycleState::kOnboarding, {Effect::kTeardownSessions}};
      if (leaving_running) {
        t.effects.push_back(Effect::kShutdownSupervisor);
      }
      t.effects.insert(t.effects.end(), {Effect::kQuiesce, Effect::kCommitState, Effect::kNotifyStartOnboarding});
      return t;
    }

    case Trigger::kStartLnd:
      if (from != LifecycleState::kOnboarding) {
        return std::nullopt;
      }
      return Transition{LifecycleState::kRunning, {Effect::kLogLaunchSettings, Effect::kSpawnSupervisor, Effect::kCommitState}};

    case Trigger::kConnectLnd:
      if (from != LifecycleState::kOnboarding) {
        return std::nullopt;
      }
      return Transition{LifecycleState::kConnected, {Effect::kLogRemoteSettings, Effect::kCommitState, Effect::kConnectWallet}};

    case Trigger::kTerminate: {
      Transition t{LifecycleState::kTerminated, {Effect::kTeardownSessions}};
      if (leaving_running) {
        t.effects.push_back(Effect::kShutdownSupervisor);
      }
      t.effects.insert(t.effects.end(), {Effect::kCommitState, Effect::kExitProcess});
      return t;
    }
  }
  return std::nullopt;
}

const char* ToString(LifecycleState state) {
  switch (state) {
    case LifecycleState::kInit:
      return "init";
    case LifecycleState::kOnboarding:
      return "onboarding";
    case LifecycleState::kRunning:
      return "running";
    case LifecycleState::kConnected:
      return "connected";
    case LifecycleState::kTerminated:
      return "terminated";
  }
  return "unknown";
}

const char* ToString(Trigger trigger) {
  switch (trigger) {
    case Trigger::kStartOnboarding:
      return "startOnboarding";
    case Trigger::kStartLnd:
      return "startLnd";
    case Trigger::kConnectLnd:
      return "connectLnd";
    case Trigger::kTerminate:
      return "terminate";
  }
  return "unknown";
}

const char* ToString(Effect effect) {
  switch (effect) {
    case Effect::kTeardownSessions:
      return "teardown_sessions";
    case Effect::kShutdownSupervisor:
      return "shutdown_supervisor";
    case Effect::kQuiesce:
      return "quiesce";
    case Effect::kCommitState:
      return "commit_state";
    case Effect::kNotifyStartOnboarding:
      return "notify_start_onboarding";
    case Effect::kLogLaunchSettings:
      return "log_launch_settings";
    case Effect::kLogRemoteSettings:
      return "log_remote_settings";
    case Effect::kSpawnSupervisor:
      return "spawn_supervisor";
    case Effect::kConnectWallet:
      return "connect_wallet";
    case Effect::kExitProcess:
      return "exit_process";
  }
  return "unknown";
}

} // namespace bolt::coordinator
