#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace bolt::coordinator { class LifecycleCoordinator; }
namespace bolt::grpc { class NotificationBroadcaster; }
namespace bolt::relay { class MessageRelay; }

namespace bolt::factory {

/*
  Application

  Owns all long-lived objects used by the controller.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<relay::MessageRelay> relay;
  std::shared_ptr<grpc::NotificationBroadcaster> broadcaster;
  std::shared_ptr<coordinator::LifecycleCoordinator> coordinator;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire controller based on runtime config.

  This is the composition root of the application and the only place that
  knows the concrete supervisor and session types. `on_exit` is invoked from
  the coordinator when the terminate transition completes.
*/
Application Build(const bolt::runtime::config::RuntimeConfig& config, std::function<void()> on_exit);

} // namespace bolt::factory
