#pragma once

#include "bolt/controller/v1.hpp"
#include "internal/coordinator/state_machine.hpp"
#include "service_context.hpp"

namespace bolt::service {

/*
  Translates boundary requests into coordinator triggers and relay commands.
  Blocking: each call returns once the coordinator has finished the work.
*/
class ControllerService {
public:
  explicit ControllerService(ServiceContext ctx);

  bolt::controller::v1::FinishOnboardingResponse
  FinishOnboarding(const bolt::controller::v1::OnboardingOptions& req);

  void StartOnboarding();
  void StartLightningWallet();
  void Terminate();

  bolt::controller::v1::GetStateResponse
  GetState(const bolt::controller::v1::GetStateRequest& req);

  bolt::controller::v1::CommandResult
  Dispatch(const bolt::controller::v1::Command& req);

private:
  ServiceContext ctx_;
};

bolt::controller::v1::LifecycleState ToProto(bolt::coordinator::LifecycleState state);

}
