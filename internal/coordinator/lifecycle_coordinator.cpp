#include "lifecycle_coordinator.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bolt::coordinator {

using bolt::observability::BoolField;
using bolt::observability::IntField;
using bolt::observability::StringField;

namespace {

std::atomic<bool> g_live_coordinator{false};

google::protobuf::Value ProfileValue(const std::optional<profile::ConnectionProfile>& active) {
  if (!active.has_value()) {
    return relay::NullValue();
  }

  google::protobuf::Value value;
  auto*                   fields = value.mutable_struct_value()->mutable_fields();
  (*fields)["type"]              = relay::StringValue(std::string(profile::ToString(active->Type())));
  (*fields)["currency"]          = relay::StringValue(active->Currency());
  (*fields)["network"]           = relay::StringValue(active->Network());
  (*fields)["wallet"]            = relay::StringValue(active->Wallet());

  auto* settings = (*fields)["settings"].mutable_struct_value()->mutable_fields();
  for (const auto& [key, setting] : active->AllSettings()) {
    (*settings)[key] = relay::StringValue(setting);
  }
  return value;
}

google::protobuf::Value FieldError(const std::string& field, const std::string& message) {
  google::protobuf::Value value;
  (*value.mutable_struct_value()->mutable_fields())[field] = relay::StringValue(message);
  return value;
}

// Certificate and macaroon failures are reported on their own field; every
// other connect failure is folded into a host error.
google::protobuf::Value ConnectErrorValue(const util::ConnectError& error) {
  if (dynamic_cast<const util::CertificateError*>(&error)) {
    return FieldError("cert", error.what());
  }
  if (dynamic_cast<const util::MacaroonError*>(&error)) {
    return FieldError("macaroon", error.what());
  }
  if (dynamic_cast<const util::HostUnreachableError*>(&error)) {
    return FieldError("host", error.what());
  }
  return FieldError("host", std::string("Unable to connect to host: ") + error.what());
}

google::protobuf::Value JsonValue(const std::string& json) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    return relay::StringValue(json);
  }
  return value;
}

} // namespace

LifecycleCoordinator::LifecycleCoordinator(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {
  if (!deps_.supervisor || !deps_.sessions || !deps_.relay || !deps_.store) {
    throw util::InvalidState("lifecycle coordinator dependencies are incomplete");
  }
  if (g_live_coordinator.exchange(true)) {
    throw util::InvalidState("a lifecycle coordinator is already running in this process");
  }
}

LifecycleCoordinator::~LifecycleCoordinator() {
  Stop();
  deps_.relay->SetUnlockObserver(nullptr);
  TeardownSessions();
  g_live_coordinator.store(false);
}

void LifecycleCoordinator::Start() {
  if (dispatcher_.joinable()) {
    throw util::InvalidState("lifecycle coordinator already started");
  }

  try {
    auto stored = deps_.store->Load();
    if (stored.has_value()) {
      BOLT_LOG_INFO("Resuming saved connection", {StringField("type", profile::ToString(stored->Type())),
                                                  StringField("wallet", stored->Wallet())});
    }
    std::lock_guard lock(profile_mutex_);
    profile_ = std::move(stored);
  } catch (const util::ConfigValidationError& e) {
    BOLT_LOG_WARN("Ignoring invalid saved connection", {StringField("error", e.what())});
  }

  deps_.relay->SetUnlockObserver([this] { queue_.Enqueue(WalletUnlocked{}); });

  dispatcher_ = std::thread([this] { Run(); });
}

void LifecycleCoordinator::Stop() {
  queue_.Shutdown();
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
}

template <typename Request>
std::future<void> LifecycleCoordinator::EnqueueRequest(Request request) {
  auto future = request.done.get_future();
  if (!queue_.Enqueue(Envelope(std::move(request)))) {
    std::promise<void> rejected;
    rejected.set_exception(std::make_exception_ptr(util::InvalidState("lifecycle coordinator is stopped")));
    return rejected.get_future();
  }
  return future;
}

std::future<void> LifecycleCoordinator::Submit(Trigger trigger) {
  TriggerRequest request;
  request.trigger = trigger;
  return EnqueueRequest(std::move(request));
}

std::future<void> LifecycleCoordinator::FinishOnboarding(profile::ConnectionType type, profile::ConnectionProfile::Settings options) {
  OnboardingRequest request;
  request.type    = type;
  request.options = std::move(options);
  return EnqueueRequest(std::move(request));
}

std::future<void> LifecycleCoordinator::StartLightningWallet() {
  return EnqueueRequest(StartLightningWalletRequest{});
}

void LifecycleCoordinator::Post(process::NodeEvent event) {
  if (!queue_.Enqueue(std::move(event))) {
    BOLT_LOG_DEBUG("Dropping node event after stop");
  }
}

LifecycleState LifecycleCoordinator::State() const {
  return state_.load();
}

std::optional<profile::ConnectionProfile> LifecycleCoordinator::ActiveProfile() const {
  std::lock_guard lock(profile_mutex_);
  return profile_;
}

// ------------------------------------------------------------
// Dispatcher
// ------------------------------------------------------------

void LifecycleCoordinator::Run() {
  while (auto envelope = queue_.Dequeue()) {
    std::visit([this](auto& item) { Handle(item); }, *envelope);
  }
}

void LifecycleCoordinator::Handle(TriggerRequest& request) {
  try {
    Execute(request.trigger);
    request.done.set_value();
  } catch (const std::exception& e) {
    BOLT_LOG_WARN("Transition rejected", {StringField("trigger", ToString(request.trigger)), StringField("error", e.what())});
    request.done.set_exception(std::current_exception());
  }
}

void LifecycleCoordinator::Handle(OnboardingRequest& request) {
  try {
    if (state_.load() != LifecycleState::kOnboarding) {
      throw util::InvalidTransition(std::string("cannot finish onboarding while ") + ToString(state_.load()));
    }

    auto built = profile::ConnectionProfile::FromOptions(request.type, options_.currency, options_.network, options_.wallet,
                                                         request.options);
    deps_.store->Save(built);
    {
      std::lock_guard lock(profile_mutex_);
      profile_ = built;
    }

    Execute(built.IsLocal() ? Trigger::kStartLnd : Trigger::kConnectLnd);
    request.done.set_value();
  } catch (const std::exception& e) {
    BOLT_LOG_WARN("Onboarding rejected", {StringField("type", profile::ToString(request.type)), StringField("error", e.what())});
    request.done.set_exception(std::current_exception());
  }
}

void LifecycleCoordinator::Handle(StartLightningWalletRequest& request) {
  try {
    const auto state = state_.load();
    if (state != LifecycleState::kRunning && state != LifecycleState::kConnected) {
      throw util::InvalidState(std::string("cannot start lightning wallet while ") + ToString(state));
    }
    ConnectWallet();
    request.done.set_value();
  } catch (const std::exception&) {
    request.done.set_exception(std::current_exception());
  }
}

void LifecycleCoordinator::Handle(WalletUnlocked&) {
  const auto state = state_.load();
  if (state != LifecycleState::kRunning && state != LifecycleState::kConnected) {
    return;
  }

  // A local node announces its lightning interface once it is up.
  if (state == LifecycleState::kRunning) {
    BOLT_LOG_INFO("Wallet unlocked, waiting for lightning interface");
    return;
  }

  BOLT_LOG_INFO("Wallet unlocked, connecting lightning interface");
  try {
    ConnectWallet();
  } catch (const std::exception& e) {
    BOLT_LOG_ERROR("Failed to connect after unlock", {StringField("error", e.what())});
  }
}

void LifecycleCoordinator::Handle(process::NodeEvent& event) {
  const auto state = state_.load();
  if (event.generation != generation_ || (state != LifecycleState::kRunning && state != LifecycleState::kConnected)) {
    BOLT_LOG_DEBUG("Ignoring stale node event", {StringField("event", process::ToString(event.type)),
                                                 IntField("generation", static_cast<std::int64_t>(event.generation)),
                                                 StringField("state", ToString(state))});
    return;
  }

  try {
    switch (event.type) {
      case process::NodeEventType::kSyncWaiting:
        Push("lndSyncStatus", relay::StringValue("waiting"));
        break;
      case process::NodeEventType::kSyncStarted:
        Push("lndSyncStatus", relay::StringValue("in-progress"));
        break;
      case process::NodeEventType::kSyncFinished:
        Push("lndSyncStatus", relay::StringValue("complete"));
        break;
      case process::NodeEventType::kRemoteBlockHeight:
        Push("currentBlockHeight", relay::NumberValue(static_cast<double>(event.height)));
        break;
      case process::NodeEventType::kLocalBlockHeight:
        Push("lndBlockHeight", relay::NumberValue(static_cast<double>(event.height)));
        break;
      case process::NodeEventType::kCompactFilterHeight:
        Push("lndCfilterHeight", relay::NumberValue(static_cast<double>(event.height)));
        break;

      case process::NodeEventType::kUnlockerReady:
        ConnectWallet();
        break;

      case process::NodeEventType::kLightningReady:
        if (lightning_ && lightning_->CanDisconnect()) {
          break;
        }
        ConnectWallet();
        break;

      case process::NodeEventType::kProcessError: {
        BOLT_LOG_ERROR("Node process error", {StringField("detail", event.detail)});
        google::protobuf::Value data;
        (*data.mutable_struct_value()->mutable_fields())["message"] = relay::StringValue(event.detail);
        Push("lndError", std::move(data));
        break;
      }

      case process::NodeEventType::kProcessExited: {
        BOLT_LOG_ERROR("Node process exited while active", {IntField("code", event.exit_code), IntField("signal", event.signal),
                                                            StringField("last_error", event.detail)});
        google::protobuf::Value data;
        auto*                   fields = data.mutable_struct_value()->mutable_fields();
        (*fields)["code"]              = relay::NumberValue(event.exit_code);
        (*fields)["signal"]            = relay::NumberValue(event.signal);
        (*fields)["lastError"]         = relay::StringValue(event.detail);
        Push("lndExited", std::move(data));

        Execute(Trigger::kTerminate);
        break;
      }
    }
  } catch (const std::exception& e) {
    BOLT_LOG_ERROR("Failed to handle node event", {StringField("event", process::ToString(event.type)), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Transitions
// ------------------------------------------------------------

void LifecycleCoordinator::Execute(Trigger trigger) {
  const auto from       = state_.load();
  const auto transition = FindTransition(from, trigger);
  if (!transition.has_value()) {
    throw util::InvalidTransition(std::string("cannot ") + ToString(trigger) + " while " + ToString(from));
  }

  BOLT_LOG_DEBUG("[FSM] begin", {StringField("trigger", ToString(trigger)), StringField("from", ToString(from)),
                                 StringField("to", ToString(transition->to))});

  for (const auto effect : transition->effects) {
    BOLT_LOG_DEBUG("[FSM] effect", {StringField("effect", ToString(effect))});
    RunEffect(effect, transition->to);
  }
}

void LifecycleCoordinator::RunEffect(Effect effect, LifecycleState to) {
  switch (effect) {
    case Effect::kTeardownSessions:
      TeardownSessions();
      break;

    case Effect::kShutdownSupervisor:
      ShutdownSupervisor();
      break;

    case Effect::kQuiesce:
      std::this_thread::sleep_for(options_.quiescence);
      break;

    case Effect::kCommitState: {
      const auto from = state_.exchange(to);
      BOLT_LOG_INFO("Lifecycle state changed", {StringField("from", ToString(from)), StringField("to", ToString(to))});
      break;
    }

    case Effect::kNotifyStartOnboarding:
      NotifyStartOnboarding();
      break;

    case Effect::kLogLaunchSettings: {
      const auto& active = RequireProfile();
      if (!active.IsLocal()) {
        throw util::InvalidState("startLnd requires a local connection profile");
      }
      BOLT_LOG_INFO("Launching local node", {StringField("alias", active.Setting("alias")), BoolField("autopilot", active.Autopilot()),
                                             StringField("network", active.Network())});
      break;
    }

    case Effect::kLogRemoteSettings: {
      const auto& active = RequireProfile();
      if (active.IsLocal()) {
        throw util::InvalidState("connectLnd requires a remote connection profile");
      }
      BOLT_LOG_INFO("Connecting to remote node",
                    {StringField("type", profile::ToString(active.Type())), StringField("host", active.Setting("host"))});
      break;
    }

    case Effect::kSpawnSupervisor:
      SpawnSupervisor();
      break;

    case Effect::kConnectWallet:
      ConnectWallet();
      break;

    case Effect::kExitProcess:
      BOLT_LOG_INFO("Controller terminated");
      if (options_.on_exit) {
        options_.on_exit();
      }
      break;
  }
}

void LifecycleCoordinator::TeardownSessions() {
  deps_.relay->Unbind(relay::Channel::kLightning);
  deps_.relay->Unbind(relay::Channel::kWalletUnlocker);

  for (auto* session : {&lightning_, &unlocker_}) {
    if (*session && (*session)->CanDisconnect()) {
      (*session)->Disconnect();
    }
    session->reset();
  }
}

void LifecycleCoordinator::ShutdownSupervisor() {
  const auto outcome = deps_.supervisor->Shutdown(options_.shutdown_timeout);
  BOLT_LOG_INFO("Node supervisor stopped", {StringField("outcome", process::ToString(outcome))});
}

void LifecycleCoordinator::SpawnSupervisor() {
  const auto& active = RequireProfile();
  try {
    generation_ = deps_.supervisor->Start(active, [this](const process::NodeEvent& event) { Post(event); });
  } catch (const util::SpawnError& e) {
    BOLT_LOG_ERROR("Failed to start node process", {StringField("error", e.what())});
    Push("startLndError", [&] {
      google::protobuf::Value data;
      (*data.mutable_struct_value()->mutable_fields())["process"] = relay::StringValue(e.what());
      return data;
    }());
    throw;
  }
}

void LifecycleCoordinator::ConnectWallet() {
  const auto& active = RequireProfile();

  TeardownSessions();

  const auto connect_options = MakeConnectOptions();

  auto lightning = deps_.sessions->Create(rpc::SessionKind::kLightning);
  try {
    lightning->Connect(active, connect_options);

    auto message_relay = deps_.relay;
    lightning->Subscribe([message_relay](std::string_view event, const std::string& json) {
      message_relay->Push(std::string(event), JsonValue(json));
    });

    lightning_ = std::move(lightning);
    deps_.relay->Bind(relay::Channel::kLightning, lightning_);
    Push("lightningGrpcActive", relay::NullValue());
    return;
  } catch (const util::UnimplementedError& e) {
    BOLT_LOG_INFO("Lightning interface unavailable, starting wallet unlocker", {StringField("detail", e.what())});
  } catch (const util::ConnectError& e) {
    BOLT_LOG_WARN("Unable to connect to lightning interface", {StringField("error", e.what())});
    Push("startLndError", ConnectErrorValue(e));
    return;
  }

  auto unlocker = deps_.sessions->Create(rpc::SessionKind::kWalletUnlocker);
  try {
    unlocker->Connect(active, connect_options);
  } catch (const util::ConnectError& e) {
    BOLT_LOG_WARN("Unable to connect to wallet unlocker", {StringField("error", e.what())});
    Push("startLndError", ConnectErrorValue(e));
    return;
  }

  unlocker_ = std::move(unlocker);
  deps_.relay->Bind(relay::Channel::kWalletUnlocker, unlocker_);
  Push("walletUnlockerGrpcActive", relay::NullValue());
}

void LifecycleCoordinator::NotifyStartOnboarding() {
  std::optional<profile::ConnectionProfile> active;
  {
    std::lock_guard lock(profile_mutex_);
    active = profile_;
  }
  Push("startOnboarding", ProfileValue(active));
}

rpc::ConnectOptions LifecycleCoordinator::MakeConnectOptions() const {
  const auto& active = RequireProfile();

  rpc::ConnectOptions options;
  options.endpoint        = rpc::ResolveEndpoint(active, options_.layout);
  options.cipher_suites   = options_.tls_policy.CipherSuitesFor(active.Type());
  options.connect_timeout = options_.connect_timeout;
  options.call_timeout    = options_.call_timeout;
  return options;
}

void LifecycleCoordinator::Push(const std::string& name, google::protobuf::Value data) {
  deps_.relay->Push(name, std::move(data));
}

const profile::ConnectionProfile& LifecycleCoordinator::RequireProfile() const {
  // profile_ is only replaced on the dispatcher thread, which is the caller.
  if (!profile_.has_value()) {
    throw util::InvalidState("no active connection profile");
  }
  return *profile_;
}

} // namespace bolt::coordinator
