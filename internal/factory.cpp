#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/coordinator/lifecycle_coordinator.hpp"
#include "internal/grpc/controller_server.hpp"
#include "internal/grpc/notification_broadcaster.hpp"
#include "internal/process/node_supervisor.hpp"
#include "internal/profile/profile_store.hpp"
#include "internal/relay/message_relay.hpp"
#include "internal/rpc/grpc_session_factory.hpp"
#include "internal/rpc/tls_policy.hpp"
#include "internal/service/controller_service.hpp"
#include "internal/service/service_context.hpp"

namespace bolt::factory {

using bolt::config::ToMillis;

/*
    Build full application dependency graph
*/
Application Build(const bolt::runtime::config::RuntimeConfig& config, std::function<void()> on_exit) {
  Application app;

  // ------------------------------------------------------------------
  // Boundary plumbing
  // ------------------------------------------------------------------
  app.relay       = std::make_shared<relay::MessageRelay>();
  app.broadcaster = std::make_shared<grpc::NotificationBroadcaster>();
  app.relay->AttachSink(app.broadcaster);

  // ------------------------------------------------------------------
  // Lifecycle collaborators
  // ------------------------------------------------------------------
  const auto lnd_config = config.lnd();

  coordinator::Dependencies deps;
  deps.supervisor = std::make_shared<process::LndSupervisor>(
      [lnd_config](const profile::ConnectionProfile& profile) { return process::BuildLndCommand(lnd_config, profile); });
  deps.sessions = std::make_shared<rpc::GrpcSessionFactory>();
  deps.relay    = app.relay;
  deps.store    = std::make_shared<profile::ProfileStore>(config.storage().data_dir());

  const auto& lifecycle = config.lifecycle();

  coordinator::Options options;
  options.shutdown_timeout  = ToMillis(lifecycle.shutdown_timeout());
  options.quiescence        = ToMillis(lifecycle.quiescence_interval());
  options.connect_timeout   = ToMillis(lifecycle.connect_timeout());
  options.call_timeout      = ToMillis(lifecycle.call_timeout());
  options.tls_policy        = rpc::TlsPolicy::FromEnvironment();
  options.layout.lnd_dir    = lnd_config.lnd_dir();
  options.layout.rpc_listen = lnd_config.rpc_listen();
  options.currency          = config.onboarding().currency();
  options.network           = config.onboarding().network();
  options.wallet            = config.onboarding().wallet();
  options.on_exit           = std::move(on_exit);

  app.coordinator = std::make_shared<coordinator::LifecycleCoordinator>(std::move(deps), std::move(options));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator = app.coordinator;
  ctx.relay       = app.relay;

  auto controller_service = std::make_shared<service::ControllerService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ControllerServer>(controller_service, app.broadcaster));

  return app;
}

} // namespace bolt::factory
