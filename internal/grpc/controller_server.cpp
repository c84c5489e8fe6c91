#include "controller_server.hpp"
#include "grpc_error.hpp"

#include <chrono>

namespace bolt::grpc {

ControllerServer::ControllerServer(std::shared_ptr<bolt::service::ControllerService> svc,
                                   std::shared_ptr<NotificationBroadcaster> broadcaster)
    : service_(std::move(svc)), broadcaster_(std::move(broadcaster)) {}

::grpc::Status ControllerServer::FinishOnboarding(::grpc::ServerContext*,
                                                  const bolt::controller::v1::OnboardingOptions* req,
                                                  bolt::controller::v1::FinishOnboardingResponse* resp) {
  try {
    *resp = service_->FinishOnboarding(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::StartOnboarding(::grpc::ServerContext*,
                                                 const google::protobuf::Empty*,
                                                 google::protobuf::Empty*) {
  try {
    service_->StartOnboarding();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::StartLightningWallet(::grpc::ServerContext*,
                                                      const google::protobuf::Empty*,
                                                      google::protobuf::Empty*) {
  try {
    service_->StartLightningWallet();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::Terminate(::grpc::ServerContext*,
                                           const google::protobuf::Empty*,
                                           google::protobuf::Empty*) {
  try {
    service_->Terminate();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::GetState(::grpc::ServerContext*,
                                          const bolt::controller::v1::GetStateRequest* req,
                                          bolt::controller::v1::GetStateResponse* resp) {
  try {
    *resp = service_->GetState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::Dispatch(::grpc::ServerContext*,
                                          const bolt::controller::v1::Command* req,
                                          bolt::controller::v1::CommandResult* resp) {
  try {
    *resp = service_->Dispatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControllerServer::WatchNotifications(::grpc::ServerContext* ctx,
                                                    const bolt::controller::v1::WatchRequest*,
                                                    ::grpc::ServerWriter<bolt::controller::v1::Notification>* writer) {
  auto watcher = broadcaster_->Attach();

  // Poll so a cancelled client is noticed even when nothing is published.
  while (!ctx->IsCancelled()) {
    auto notification = watcher->DequeueFor(std::chrono::milliseconds(250));
    if (!notification.has_value()) {
      if (watcher->IsShutdown()) {
        break;
      }
      continue;
    }
    if (!writer->Write(*notification)) {
      break;
    }
  }

  broadcaster_->Detach(watcher);
  return ::grpc::Status::OK;
}

} // namespace bolt::grpc
