#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "bolt/controller/v1.hpp"
#include "internal/service/controller_service.hpp"
#include "notification_broadcaster.hpp"

namespace bolt::grpc {

class ControllerServer final : public bolt::controller::v1::ControllerService::Service {
public:
  ControllerServer(std::shared_ptr<bolt::service::ControllerService> svc,
                   std::shared_ptr<NotificationBroadcaster> broadcaster);

  ::grpc::Status FinishOnboarding(::grpc::ServerContext*,
                                  const bolt::controller::v1::OnboardingOptions*,
                                  bolt::controller::v1::FinishOnboardingResponse*) override;

  ::grpc::Status StartOnboarding(::grpc::ServerContext*,
                                 const google::protobuf::Empty*,
                                 google::protobuf::Empty*) override;

  ::grpc::Status StartLightningWallet(::grpc::ServerContext*,
                                      const google::protobuf::Empty*,
                                      google::protobuf::Empty*) override;

  ::grpc::Status Terminate(::grpc::ServerContext*,
                           const google::protobuf::Empty*,
                           google::protobuf::Empty*) override;

  ::grpc::Status GetState(::grpc::ServerContext*,
                          const bolt::controller::v1::GetStateRequest*,
                          bolt::controller::v1::GetStateResponse*) override;

  ::grpc::Status Dispatch(::grpc::ServerContext*,
                          const bolt::controller::v1::Command*,
                          bolt::controller::v1::CommandResult*) override;

  ::grpc::Status WatchNotifications(::grpc::ServerContext*,
                                    const bolt::controller::v1::WatchRequest*,
                                    ::grpc::ServerWriter<bolt::controller::v1::Notification>*) override;

private:
  std::shared_ptr<bolt::service::ControllerService> service_;
  std::shared_ptr<NotificationBroadcaster> broadcaster_;
};

} // namespace bolt::grpc
