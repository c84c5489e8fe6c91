#include "controller_service.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/coordinator/lifecycle_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/relay/message_relay.hpp"
#include "internal/util/errors.hpp"

namespace bolt::service {

using namespace bolt::controller::v1;
using bolt::observability::StringField;

namespace {

profile::ConnectionType FromProto(ConnectionType type) {
  switch (type) {
    case CONNECTION_TYPE_LOCAL:
      return profile::ConnectionType::kLocal;
    case CONNECTION_TYPE_CUSTOM:
      return profile::ConnectionType::kCustom;
    case CONNECTION_TYPE_HOSTED_SERVICE:
      return profile::ConnectionType::kHostedService;
    default:
      throw util::ConfigValidationError("connection type is required");
  }
}

ConnectionType ToProto(profile::ConnectionType type) {
  switch (type) {
    case profile::ConnectionType::kLocal:
      return CONNECTION_TYPE_LOCAL;
    case profile::ConnectionType::kCustom:
      return CONNECTION_TYPE_CUSTOM;
    case profile::ConnectionType::kHostedService:
      return CONNECTION_TYPE_HOSTED_SERVICE;
  }
  return CONNECTION_TYPE_UNSPECIFIED;
}

template <typename Call>
void Await(const char* route, Call&& call) {
  try {
    call().get();
  } catch (const std::exception& ex) {
    BOLT_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    throw;
  }
}

} // namespace

LifecycleState ToProto(bolt::coordinator::LifecycleState state) {
  switch (state) {
    case bolt::coordinator::LifecycleState::kInit:
      return LIFECYCLE_STATE_INIT;
    case bolt::coordinator::LifecycleState::kOnboarding:
      return LIFECYCLE_STATE_ONBOARDING;
    case bolt::coordinator::LifecycleState::kRunning:
      return LIFECYCLE_STATE_RUNNING;
    case bolt::coordinator::LifecycleState::kConnected:
      return LIFECYCLE_STATE_CONNECTED;
    case bolt::coordinator::LifecycleState::kTerminated:
      return LIFECYCLE_STATE_TERMINATED;
  }
  return LIFECYCLE_STATE_UNSPECIFIED;
}

ControllerService::ControllerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

FinishOnboardingResponse ControllerService::FinishOnboarding(const OnboardingOptions& req) {
  const auto                           type = FromProto(req.type());
  profile::ConnectionProfile::Settings options;
  for (const auto& [key, value] : req.settings()) {
    options.emplace(key, value);
  }

  Await("ControllerService.FinishOnboarding", [&] { return ctx_.coordinator->FinishOnboarding(type, std::move(options)); });

  FinishOnboardingResponse resp;
  resp.set_state(ToProto(ctx_.coordinator->State()));
  return resp;
}

void ControllerService::StartOnboarding() {
  Await("ControllerService.StartOnboarding", [&] { return ctx_.coordinator->Submit(coordinator::Trigger::kStartOnboarding); });
}

void ControllerService::StartLightningWallet() {
  Await("ControllerService.StartLightningWallet", [&] { return ctx_.coordinator->StartLightningWallet(); });
}

void ControllerService::Terminate() {
  Await("ControllerService.Terminate", [&] { return ctx_.coordinator->Submit(coordinator::Trigger::kTerminate); });
}

GetStateResponse ControllerService::GetState(const GetStateRequest&) {
  GetStateResponse resp;
  resp.set_state(ToProto(ctx_.coordinator->State()));

  if (const auto active = ctx_.coordinator->ActiveProfile()) {
    resp.set_connection_type(ToProto(active->Type()));
    resp.set_alias(active->Setting("alias"));
    resp.set_host(active->Setting("host"));
  }
  return resp;
}

CommandResult ControllerService::Dispatch(const Command& req) {
  const auto channel = relay::ParseChannel(req.channel());
  if (!channel.has_value()) {
    throw util::NotFound("unknown channel: " + req.channel());
  }

  std::string payload;
  if (req.has_payload()) {
    auto status = google::protobuf::util::MessageToJsonString(req.payload(), &payload);
    if (!status.ok()) {
      throw util::ConfigValidationError("invalid payload: " + std::string(status.message()));
    }
  }

  CommandResult resp;

  const auto result = ctx_.relay->Dispatch(*channel, req.method(), payload);
  if (!result.has_value()) {
    resp.set_dropped(true);
    return resp;
  }

  resp.set_ok(result->ok);
  if (!result->ok) {
    resp.set_error_code(result->code);
    resp.set_error_message(result->message);
    return resp;
  }

  if (!result->json.empty()) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(result->json, resp.mutable_result(), options);
    if (!status.ok()) {
      throw std::runtime_error("failed to encode result: " + std::string(status.message()));
    }
  }
  return resp;
}

} // namespace bolt::service
