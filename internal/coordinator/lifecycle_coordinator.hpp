#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "internal/process/node_supervisor.hpp"
#include "internal/profile/connection_profile.hpp"
#include "internal/profile/profile_store.hpp"
#include "internal/relay/message_relay.hpp"
#include "internal/rpc/connect_options.hpp"
#include "internal/rpc/rpc_session.hpp"
#include "internal/rpc/tls_policy.hpp"
#include "internal/util/blocking_queue.hpp"
#include "state_machine.hpp"

namespace bolt::coordinator {

struct Dependencies {
  std::shared_ptr<process::NodeSupervisor> supervisor;
  std::shared_ptr<rpc::SessionFactory>     sessions;
  std::shared_ptr<relay::MessageRelay>     relay;
  std::shared_ptr<profile::ProfileStore>   store;
};

struct Options {
  std::chrono::milliseconds shutdown_timeout{10'000};
  std::chrono::milliseconds quiescence{200};
  std::chrono::milliseconds connect_timeout{10'000};
  std::chrono::milliseconds call_timeout{60'000};

  rpc::TlsPolicy       tls_policy;
  rpc::LocalNodeLayout layout;

  // Scope of profiles created by FinishOnboarding.
  std::string currency = "bitcoin";
  std::string network  = "testnet";
  std::string wallet   = "wallet-1";

  // Invoked from the dispatcher thread when the terminate transition exits.
  std::function<void()> on_exit;
};

/*
  Top-level lifecycle state machine.

  All transitions and node events are executed one at a time on a single
  dispatcher thread. Callers get a future that resolves once the transition,
  including its connect or shutdown side effects, has completed, or that
  carries the error that rejected it.

  At most one coordinator may be alive per process.
*/
class LifecycleCoordinator {
 public:
  LifecycleCoordinator(Dependencies deps, Options options);
  ~LifecycleCoordinator();

  LifecycleCoordinator(const LifecycleCoordinator&)            = delete;
  LifecycleCoordinator& operator=(const LifecycleCoordinator&) = delete;

  // Resumes the persisted profile and starts the dispatcher.
  void Start();

  // Drains queued work and joins the dispatcher. Must not be called from
  // the on_exit hook.
  void Stop();

  std::future<void> Submit(Trigger trigger);

  // Builds and saves a profile from `options`, then fires startLnd (local)
  // or connectLnd (remote).
  std::future<void> FinishOnboarding(profile::ConnectionType type, profile::ConnectionProfile::Settings options);

  // Re-attempts the authenticated session while running or connected.
  std::future<void> StartLightningWallet();

  void Post(process::NodeEvent event);

  LifecycleState                             State() const;
  std::optional<profile::ConnectionProfile> ActiveProfile() const;

 private:
  struct TriggerRequest {
    Trigger            trigger;
    std::promise<void> done;
  };

  struct OnboardingRequest {
    profile::ConnectionType              type;
    profile::ConnectionProfile::Settings options;
    std::promise<void>                   done;
  };

  struct StartLightningWalletRequest {
    std::promise<void> done;
  };

  struct WalletUnlocked {};

  using Envelope = std::variant<TriggerRequest, OnboardingRequest, StartLightningWalletRequest, WalletUnlocked, process::NodeEvent>;

  void Run();
  void Handle(TriggerRequest& request);
  void Handle(OnboardingRequest& request);
  void Handle(StartLightningWalletRequest& request);
  void Handle(WalletUnlocked& unlocked);
  void Handle(process::NodeEvent& event);

  template <typename Request>
  std::future<void> EnqueueRequest(Request request);

  void Execute(Trigger trigger);
  void RunEffect(Effect effect, LifecycleState to);

  void TeardownSessions();
  void ShutdownSupervisor();
  void SpawnSupervisor();
  void ConnectWallet();
  void NotifyStartOnboarding();

  rpc::ConnectOptions MakeConnectOptions() const;
  void                Push(const std::string& name, google::protobuf::Value data);

  const profile::ConnectionProfile& RequireProfile() const;

  Dependencies deps_;
  Options      options_;

  std::atomic<LifecycleState> state_{LifecycleState::kInit};

  mutable std::mutex                        profile_mutex_;
  std::optional<profile::ConnectionProfile> profile_;

  // Owned by the dispatcher thread.
  std::shared_ptr<rpc::RpcSession> lightning_;
  std::shared_ptr<rpc::RpcSession> unlocker_;
  std::uint64_t                    generation_ = 0;

  util::BlockingQueue<Envelope> queue_;
  std::thread                   dispatcher_;
};

} // namespace bolt::coordinator
