#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace bolt::coordinator {

enum class LifecycleState : std::uint8_t {
  kInit        = 0,
  kOnboarding  = 1,
  kRunning     = 2,
  kConnected   = 3,
  kTerminated  = 4,
};

enum class Trigger : std::uint8_t {
  kStartOnboarding = 0,
  kStartLnd        = 1,
  kConnectLnd      = 2,
  kTerminate       = 3,
};

// Side effects of a transition, executed in order. A failure in any effect
// before kCommitState rejects the transition and leaves the state unchanged.
enum class Effect : std::uint8_t {
  kTeardownSessions,
  kShutdownSupervisor,
  kQuiesce,
  kCommitState,
  kNotifyStartOnboarding,
  kLogLaunchSettings,
  kLogRemoteSettings,
  kSpawnSupervisor,
  kConnectWallet,
  kExitProcess,
};

struct Transition {
  LifecycleState      to;
  std::vector<Effect> effects;
};

constexpr bool IsTerminal(LifecycleState state) {
  return state == LifecycleState::kTerminated;
}

// nullopt when `trigger` is not accepted in `from`.
std::optional<Transition> FindTransition(LifecycleState from, Trigger trigger);

const char* ToString(LifecycleState state);
const char* ToString(Trigger trigger);
const char* ToString(Effect effect);

} // namespace bolt::coordinator
