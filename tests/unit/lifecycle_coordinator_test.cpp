#include "internal/coordinator/lifecycle_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "fakes.hpp"
#include "internal/util/errors.hpp"

namespace {

using bolt::coordinator::LifecycleCoordinator;
using bolt::coordinator::LifecycleState;
using bolt::coordinator::Trigger;
using bolt::process::NodeEvent;
using bolt::process::NodeEventType;
using bolt::profile::ConnectionType;
using bolt::relay::Channel;
using bolt::rpc::SessionKind;
using bolt::testing::Fails;
using bolt::testing::WaitFor;

const bolt::profile::ConnectionProfile::Settings kLocalOptions{{"alias", "alice"}, {"autopilot", "true"}};
const bolt::profile::ConnectionProfile::Settings kCustomOptions{
    {"host", "node.example:10009"}, {"cert", "/certs/tls.cert"}, {"macaroon", "/certs/admin.macaroon"}, {"alias", "ignored"}};

struct Harness {
  explicit Harness(const std::string& name) {
    supervisor = std::make_shared<bolt::testing::FakeSupervisor>();
    sessions   = std::make_shared<bolt::testing::FakeSessionFactory>();
    relay      = std::make_shared<bolt::relay::MessageRelay>();
    store      = std::make_shared<bolt::profile::ProfileStore>(bolt::testing::FreshDir(name));
    sink       = std::make_shared<bolt::testing::RecordingSink>();
    relay->AttachSink(sink);
  }

  ~Harness() {
    coordinator.reset();
  }

  LifecycleCoordinator& Build() {
    bolt::coordinator::Options options;
    options.quiescence       = std::chrono::milliseconds(1);
    options.shutdown_timeout = std::chrono::milliseconds(50);
    options.layout.lnd_dir   = "/tmp/bolt-controller-unit/lnd";
    options.on_exit          = [this] { exited = true; };

    coordinator = std::make_unique<LifecycleCoordinator>(bolt::coordinator::Dependencies{supervisor, sessions, relay, store}, options);
    coordinator->Start();
    return *coordinator;
  }

  // Built, started and moved into onboarding.
  LifecycleCoordinator& Onboarding() {
    auto& c = Build();
    c.Submit(Trigger::kStartOnboarding).get();
    assert(c.State() == LifecycleState::kOnboarding);
    return c;
  }

  bool Pushed(const std::string& name) const {
    return sink->Count(name) > 0;
  }

  bolt::controller::v1::Notification Last(const std::string& name) const {
    const auto notifications = sink->Notifications();
    for (auto it = notifications.rbegin(); it != notifications.rend(); ++it) {
      if (it->name() == name) {
        return *it;
      }
    }
    assert(false && "notification was not pushed");
    return {};
  }

  std::shared_ptr<bolt::testing::FakeSupervisor>     supervisor;
  std::shared_ptr<bolt::testing::FakeSessionFactory> sessions;
  std::shared_ptr<bolt::relay::MessageRelay>         relay;
  std::shared_ptr<bolt::profile::ProfileStore>       store;
  std::shared_ptr<bolt::testing::RecordingSink>      sink;
  std::atomic<bool>                                  exited{false};
  std::unique_ptr<LifecycleCoordinator>              coordinator;
};

std::string FieldOf(const bolt::controller::v1::Notification& notification, const std::string& key) {
  const auto& fields = notification.data().struct_value().fields();
  const auto  it     = fields.find(key);
  return it == fields.end() ? std::string() : it->second.string_value();
}

template <typename Error, typename Future>
bool Rejects(Future&& future) {
  try {
    future.get();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestStartOnboardingWithoutSavedProfile() {
  Harness h("coordinator_fresh");
  auto&   c = h.Build();
  assert(c.State() == LifecycleState::kInit);
  assert(!c.ActiveProfile().has_value());

  c.Submit(Trigger::kStartOnboarding).get();
  assert(c.State() == LifecycleState::kOnboarding);

  const auto notification = h.Last("startOnboarding");
  assert(notification.data().has_null_value());
}

void TestSavedProfileIsOfferedOnOnboarding() {
  Harness h("coordinator_resume");
  h.store->Save(bolt::profile::ConnectionProfile::FromOptions(ConnectionType::kCustom, "bitcoin", "mainnet", "wallet-1", kCustomOptions));

  auto& c = h.Onboarding();
  assert(c.ActiveProfile().has_value());
  assert(c.ActiveProfile()->Type() == ConnectionType::kCustom);

  const auto notification = h.Last("startOnboarding");
  assert(FieldOf(notification, "type") == "custom");
  assert(FieldOf(notification, "network") == "mainnet");
  const auto& settings = notification.data().struct_value().fields().at("settings").struct_value().fields();
  assert(settings.at("host").string_value() == "node.example:10009");
  assert(settings.count("alias") == 0);
}

void TestLocalNodeReachesUnlockerThenLightning() {
  Harness h("coordinator_local");
  h.sessions->Script(SessionKind::kLightning, Fails<bolt::util::UnimplementedError>("unknown service lnrpc.Lightning"));

  auto& c = h.Onboarding();
  h.sink->Clear();

  c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions).get();
  assert(c.State() == LifecycleState::kRunning);
  assert(h.supervisor->StartedAliases().size() == 1);
  assert(h.supervisor->StartedAliases()[0] == "alice");
  assert(h.store->Load().has_value());

  h.supervisor->Emit(NodeEventType::kSyncWaiting);
  h.supervisor->Emit(NodeEventType::kSyncStarted);
  h.supervisor->Emit(NodeEventType::kRemoteBlockHeight, 2'500'000);
  h.supervisor->Emit(NodeEventType::kUnlockerReady);

  assert(WaitFor([&] { return h.Pushed("walletUnlockerGrpcActive"); }));

  const auto names = h.sink->Names();
  assert(names.size() == 4);
  assert(names[0] == "lndSyncStatus" && names[1] == "lndSyncStatus");
  assert(names[2] == "currentBlockHeight");
  assert(names[3] == "walletUnlockerGrpcActive");

  const auto notifications = h.sink->Notifications();
  assert(notifications[0].data().string_value() == "waiting");
  assert(notifications[1].data().string_value() == "in-progress");
  assert(notifications[2].data().number_value() == 2'500'000);

  auto unlocker = h.sessions->Created(SessionKind::kWalletUnlocker);
  assert(unlocker.size() == 1);
  assert(h.relay->Bound(Channel::kWalletUnlocker) == unlocker[0]);
  assert(unlocker[0]->LastOptions().endpoint.host == "localhost:10009");

  // Unlocking a local wallet waits for the node to announce its lightning
  // interface instead of reconnecting right away.
  assert(h.relay->Dispatch(Channel::kWalletUnlocker, "UnlockWallet", "{}").has_value());
  h.supervisor->Emit(NodeEventType::kSyncFinished);
  assert(WaitFor([&] { return h.sink->Count("lndSyncStatus") == 3; }));
  assert(h.sessions->Created(SessionKind::kLightning).size() == 1);

  h.supervisor->Emit(NodeEventType::kLightningReady);
  assert(WaitFor([&] { return h.Pushed("lightningGrpcActive"); }));

  auto lightning = h.sessions->Created(SessionKind::kLightning);
  assert(lightning.size() == 2);
  assert(h.relay->Bound(Channel::kLightning) == lightning[1]);
  assert(!h.relay->Bound(Channel::kWalletUnlocker));
  assert(!unlocker[0]->CanDisconnect());

  // A repeated readiness signal does not reconnect a live session.
  h.supervisor->Emit(NodeEventType::kLightningReady);
  h.supervisor->Emit(NodeEventType::kLocalBlockHeight, 10);
  assert(WaitFor([&] { return h.Pushed("lndBlockHeight"); }));
  assert(h.sessions->Created(SessionKind::kLightning).size() == 2);

  // Subscription pushes are relayed as structured data.
  lightning[1]->PushEvent("invoiceUpdate", R"({"memo":"coffee","value":"1000"})");
  assert(FieldOf(h.Last("invoiceUpdate"), "memo") == "coffee");
}

void TestRemoteHostFailureIsReportedOnHostField() {
  Harness h("coordinator_host_unreachable");
  h.sessions->Script(SessionKind::kLightning, Fails<bolt::util::HostUnreachableError>("x"));

  auto& c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kCustom, kCustomOptions).get();

  assert(c.State() == LifecycleState::kConnected);
  assert(h.supervisor->StartedAliases().empty());
  assert(FieldOf(h.Last("startLndError"), "host") == "x");
  assert(h.sessions->Created(SessionKind::kWalletUnlocker).empty());
  assert(!h.relay->Bound(Channel::kLightning));
}

void TestCredentialFailuresAreReportedOnTheirField() {
  Harness h("coordinator_credentials");
  h.sessions->Script(SessionKind::kLightning, Fails<bolt::util::CertificateError>("bad cert"));
  h.sessions->Script(SessionKind::kLightning, Fails<bolt::util::MacaroonError>("bad macaroon"));

  auto& c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kCustom, kCustomOptions).get();
  assert(FieldOf(h.Last("startLndError"), "cert") == "bad cert");

  c.StartLightningWallet().get();
  assert(FieldOf(h.Last("startLndError"), "macaroon") == "bad macaroon");

  c.StartLightningWallet().get();
  assert(h.Pushed("lightningGrpcActive"));
}

void TestUnimplementedFallsBackOnce() {
  Harness h("coordinator_fallback");
  h.sessions->Script(SessionKind::kLightning, Fails<bolt::util::UnimplementedError>("unknown service"));
  h.sessions->Script(SessionKind::kWalletUnlocker, Fails<bolt::util::UnavailableError>("connection refused"));

  auto& c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kHostedService, {{"host", "pay.example:443"}, {"macaroon", "0201"}}).get();

  assert(c.State() == LifecycleState::kConnected);
  assert(h.sessions->Created(SessionKind::kLightning).size() == 1);
  assert(h.sessions->Created(SessionKind::kWalletUnlocker).size() == 1);
  assert(FieldOf(h.Last("startLndError"), "host") == "Unable to connect to host: connection refused");
  assert(!h.Pushed("walletUnlockerGrpcActive"));
}

void TestUnlockReconnectsRemoteNode() {
  Harness h("coordinator_unlock_remote");
  h.sessions->Script(SessionKind::kLightning, Fails<bolt::util::UnimplementedError>("unknown service"));

  auto& c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kCustom, kCustomOptions).get();
  assert(h.Pushed("walletUnlockerGrpcActive"));

  const auto result = h.relay->Dispatch(Channel::kWalletUnlocker, "UnlockWallet", R"({"wallet_password":"cGFzcw=="})");
  assert(result.has_value() && result->ok);

  assert(WaitFor([&] { return h.Pushed("lightningGrpcActive"); }));
  assert(h.relay->Bound(Channel::kLightning));
  assert(!h.relay->Bound(Channel::kWalletUnlocker));
}

void TestStartLndIsRejectedOutsideOnboarding() {
  Harness h("coordinator_double_start");
  auto&   c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions).get();
  assert(c.State() == LifecycleState::kRunning);

  assert(Rejects<bolt::util::InvalidTransition>(c.Submit(Trigger::kStartLnd)));
  assert(Rejects<bolt::util::InvalidTransition>(c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions)));
  assert(c.State() == LifecycleState::kRunning);
  assert(h.supervisor->StartedAliases().size() == 1);
}

void TestFinishOnboardingBeforeOnboardingIsRejected() {
  Harness h("coordinator_early_finish");
  auto&   c = h.Build();
  assert(Rejects<bolt::util::InvalidTransition>(c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions)));
  assert(Rejects<bolt::util::InvalidState>(c.StartLightningWallet()));
  assert(c.State() == LifecycleState::kInit);
}

void TestInvalidProfileFailsBeforeConnecting() {
  Harness h("coordinator_invalid_profile");
  auto&   c = h.Onboarding();

  bool threw = false;
  try {
    c.FinishOnboarding(ConnectionType::kCustom, {{"host", "node.example:10009"}}).get();
  } catch (const bolt::util::ConfigValidationError& e) {
    threw = true;
    assert(e.MissingKeys().size() == 2);
  }
  assert(threw);
  assert(c.State() == LifecycleState::kOnboarding);
  assert(h.sessions->CreatedCount() == 0);
  assert(!h.store->Load().has_value());
}

void TestSpawnFailureStaysInOnboarding() {
  Harness h("coordinator_spawn_failure");
  h.supervisor->FailSpawnWith("executable not found or not executable: lnd");

  auto& c = h.Onboarding();
  assert(Rejects<bolt::util::SpawnError>(c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions)));
  assert(c.State() == LifecycleState::kOnboarding);
  assert(FieldOf(h.Last("startLndError"), "process") == "executable not found or not executable: lnd");
}

void TestUnexpectedExitTerminates() {
  Harness h("coordinator_exit");
  auto&   c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions).get();

  NodeEvent exited;
  exited.type      = NodeEventType::kProcessExited;
  exited.exit_code = 1;
  exited.detail    = "[ERR] LTND: unable to open database";
  h.supervisor->EmitRaw(exited, h.supervisor->CurrentGeneration());

  assert(WaitFor([&] { return h.exited.load(); }));
  assert(c.State() == LifecycleState::kTerminated);

  const auto notification = h.Last("lndExited");
  assert(FieldOf(notification, "lastError") == "[ERR] LTND: unable to open database");
  assert(notification.data().struct_value().fields().at("code").number_value() == 1);
  assert(h.supervisor->ShutdownCalls() == 1);
  assert(h.supervisor->LastTimeout() == std::chrono::milliseconds(50));

  assert(Rejects<bolt::util::InvalidTransition>(c.Submit(Trigger::kStartOnboarding)));
}

void TestProcessErrorIsRelayed() {
  Harness h("coordinator_process_error");
  auto&   c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions).get();

  NodeEvent error;
  error.type   = NodeEventType::kProcessError;
  error.detail = "failed to signal node process";
  h.supervisor->EmitRaw(error, h.supervisor->CurrentGeneration());

  assert(WaitFor([&] { return h.Pushed("lndError"); }));
  assert(FieldOf(h.Last("lndError"), "message") == "failed to signal node process");
  assert(c.State() == LifecycleState::kRunning);
}

void TestEventsFromStoppedNodeAreIgnored() {
  Harness h("coordinator_late_exit");
  auto&   c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions).get();
  const auto old_generation = h.supervisor->CurrentGeneration();

  c.Submit(Trigger::kStartOnboarding).get();
  assert(c.State() == LifecycleState::kOnboarding);
  assert(!h.supervisor->Active());

  c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions).get();
  assert(h.supervisor->CurrentGeneration() != old_generation);
  h.sink->Clear();

  NodeEvent exited;
  exited.type = NodeEventType::kProcessExited;
  h.supervisor->EmitRaw(exited, old_generation);

  NodeEvent waiting;
  waiting.type = NodeEventType::kSyncWaiting;
  h.supervisor->EmitRaw(waiting, old_generation);

  // Flush the dispatcher with a request queued behind the stale events.
  assert(Rejects<bolt::util::InvalidTransition>(c.Submit(Trigger::kStartLnd)));
  assert(c.State() == LifecycleState::kRunning);
  assert(!h.exited.load());
  assert(h.sink->Notifications().empty());
}

void TestConcurrentTriggersRunOneAtATime() {
  Harness h("coordinator_concurrent");
  auto&   c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions).get();
  h.supervisor->DelayShutdown(std::chrono::milliseconds(200));

  auto back_to_onboarding = std::async(std::launch::async, [&] { c.Submit(Trigger::kStartOnboarding).get(); });
  assert(WaitFor([&] { return h.supervisor->ShuttingDown(); }));

  // Arrives while the first transition is still stopping the node.
  auto relaunch = std::async(std::launch::async, [&] { c.FinishOnboarding(ConnectionType::kLocal, kLocalOptions).get(); });
  assert(c.State() == LifecycleState::kRunning);

  back_to_onboarding.get();
  relaunch.get();

  assert(c.State() == LifecycleState::kRunning);
  assert((h.supervisor->Trace() == std::vector<std::string>{"start", "shutdown-begin", "shutdown-end", "start"}));
  assert(h.supervisor->StartedAliases().size() == 2);
}

void TestTerminateFromConnectedLeavesSupervisorAlone() {
  Harness h("coordinator_terminate");
  auto&   c = h.Onboarding();
  c.FinishOnboarding(ConnectionType::kCustom, kCustomOptions).get();
  assert(h.Pushed("lightningGrpcActive"));

  auto lightning = h.sessions->Created(SessionKind::kLightning);
  c.Submit(Trigger::kTerminate).get();

  assert(c.State() == LifecycleState::kTerminated);
  assert(h.exited.load());
  assert(h.supervisor->ShutdownCalls() == 0);
  assert(lightning[0]->DisconnectCalls() == 1);
  assert(!h.relay->Bound(Channel::kLightning));
}

void TestOnlyOneCoordinatorPerProcess() {
  Harness h("coordinator_single");
  h.Build();

  bool threw = false;
  try {
    LifecycleCoordinator second(bolt::coordinator::Dependencies{h.supervisor, h.sessions, h.relay, h.store},
                                bolt::coordinator::Options{});
  } catch (const bolt::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestStoppedCoordinatorRejectsRequests() {
  Harness h("coordinator_stopped");
  auto&   c = h.Build();
  c.Stop();
  assert(Rejects<bolt::util::InvalidState>(c.Submit(Trigger::kStartOnboarding)));
}

} // namespace

int main() {
  TestStartOnboardingWithoutSavedProfile();
  TestSavedProfileIsOfferedOnOnboarding();
  TestLocalNodeReachesUnlockerThenLightning();
  TestRemoteHostFailureIsReportedOnHostField();
  TestCredentialFailuresAreReportedOnTheirField();
  TestUnimplementedFallsBackOnce();
  TestUnlockReconnectsRemoteNode();
  TestStartLndIsRejectedOutsideOnboarding();
  TestFinishOnboardingBeforeOnboardingIsRejected();
  TestInvalidProfileFailsBeforeConnecting();
  TestSpawnFailureStaysInOnboarding();
  TestUnexpectedExitTerminates();
  TestProcessErrorIsRelayed();
  TestEventsFromStoppedNodeAreIgnored();
  TestConcurrentTriggersRunOneAtATime();
  TestTerminateFromConnectedLeavesSupervisorAlone();
  TestOnlyOneCoordinatorPerProcess();
  TestStoppedCoordinatorRejectsRequests();

  std::cout << "bolt_controller_unit_lifecycle_coordinator: pass\n";
  return 0;
}
