#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "bolt/controller/v1.hpp"
#include "fakes.hpp"
#include "internal/coordinator/lifecycle_coordinator.hpp"
#include "internal/grpc/controller_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/controller_service.hpp"
#include "internal/service/service_context.hpp"

namespace {

using namespace bolt::controller::v1;

struct Fixture {
  explicit Fixture(const std::string& name) {
    supervisor  = std::make_shared<bolt::testing::FakeSupervisor>();
    sessions    = std::make_shared<bolt::testing::FakeSessionFactory>();
    broadcaster = std::make_shared<bolt::grpc::NotificationBroadcaster>();

    bolt::service::ServiceContext ctx;
    ctx.relay = std::make_shared<bolt::relay::MessageRelay>();
    ctx.relay->AttachSink(broadcaster);

    bolt::coordinator::Options options;
    options.quiescence = std::chrono::milliseconds(1);

    ctx.coordinator = std::make_shared<bolt::coordinator::LifecycleCoordinator>(
        bolt::coordinator::Dependencies{supervisor, sessions, ctx.relay,
                                        std::make_shared<bolt::profile::ProfileStore>(bolt::testing::FreshDir(name))},
        options);
    ctx.coordinator->Start();

    relay       = ctx.relay;
    coordinator = ctx.coordinator;
    server      = std::make_unique<bolt::grpc::ControllerServer>(std::make_shared<bolt::service::ControllerService>(ctx), broadcaster);
  }

  ~Fixture() {
    server.reset();
    coordinator.reset();
  }

  ::grpc::Status StartOnboarding() {
    google::protobuf::Empty req;
    google::protobuf::Empty resp;
    ::grpc::ServerContext   grpc_ctx;
    return server->StartOnboarding(&grpc_ctx, &req, &resp);
  }

  ::grpc::Status FinishOnboarding(const OnboardingOptions& req, FinishOnboardingResponse* resp) {
    ::grpc::ServerContext grpc_ctx;
    return server->FinishOnboarding(&grpc_ctx, &req, resp);
  }

  ::grpc::Status Dispatch(const Command& req, CommandResult* resp) {
    ::grpc::ServerContext grpc_ctx;
    return server->Dispatch(&grpc_ctx, &req, resp);
  }

  std::shared_ptr<bolt::testing::FakeSupervisor>          supervisor;
  std::shared_ptr<bolt::testing::FakeSessionFactory>      sessions;
  std::shared_ptr<bolt::grpc::NotificationBroadcaster>    broadcaster;
  std::shared_ptr<bolt::relay::MessageRelay>              relay;
  std::shared_ptr<bolt::coordinator::LifecycleCoordinator> coordinator;
  std::unique_ptr<bolt::grpc::ControllerServer>           server;
};

OnboardingOptions LocalOptions() {
  OnboardingOptions req;
  req.set_type(CONNECTION_TYPE_LOCAL);
  (*req.mutable_settings())["alias"]     = "alice";
  (*req.mutable_settings())["autopilot"] = "false";
  return req;
}

void TestFinishOnboardingBeforeOnboardingReturnsFailedPrecondition() {
  Fixture f("grpc_status_early");

  FinishOnboardingResponse resp;
  const auto               status = f.FinishOnboarding(LocalOptions(), &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestInvalidOnboardingOptionsReturnInvalidArgument() {
  Fixture f("grpc_status_invalid");
  assert(f.StartOnboarding().ok());

  OnboardingOptions missing_type = LocalOptions();
  missing_type.set_type(CONNECTION_TYPE_UNSPECIFIED);
  FinishOnboardingResponse resp;
  assert(f.FinishOnboarding(missing_type, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  OnboardingOptions missing_keys;
  missing_keys.set_type(CONNECTION_TYPE_CUSTOM);
  (*missing_keys.mutable_settings())["host"] = "node.example:10009";
  const auto status = f.FinishOnboarding(missing_keys, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message().find("cert") != std::string::npos);
  assert(f.sessions->CreatedCount() == 0);
}

void TestSpawnFailureReturnsAborted() {
  Fixture f("grpc_status_spawn");
  f.supervisor->FailSpawnWith("executable not found or not executable: lnd");
  assert(f.StartOnboarding().ok());

  FinishOnboardingResponse resp;
  assert(f.FinishOnboarding(LocalOptions(), &resp).error_code() == ::grpc::StatusCode::ABORTED);
}

void TestFinishOnboardingReportsNewState() {
  Fixture f("grpc_status_finish");
  assert(f.StartOnboarding().ok());

  FinishOnboardingResponse resp;
  assert(f.FinishOnboarding(LocalOptions(), &resp).ok());
  assert(resp.state() == LIFECYCLE_STATE_RUNNING);

  GetStateRequest       req;
  GetStateResponse      state;
  ::grpc::ServerContext grpc_ctx;
  assert(f.server->GetState(&grpc_ctx, &req, &state).ok());
  assert(state.state() == LIFECYCLE_STATE_RUNNING);
  assert(state.connection_type() == CONNECTION_TYPE_LOCAL);
  assert(state.alias() == "alice");
  assert(state.host().empty());
}

void TestUnknownChannelReturnsNotFound() {
  Fixture f("grpc_status_channel");

  Command req;
  req.set_channel("router");
  req.set_method("QueryRoutes");
  CommandResult resp;
  assert(f.Dispatch(req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCommandWithoutSessionIsDropped() {
  Fixture f("grpc_status_dropped");

  Command req;
  req.set_channel("lightning");
  req.set_method("GetInfo");
  CommandResult resp;
  assert(f.Dispatch(req, &resp).ok());
  assert(resp.dropped());
  assert(!resp.ok());
}

void TestCommandReachesConnectedNode() {
  Fixture f("grpc_status_dispatch");
  assert(f.StartOnboarding().ok());

  OnboardingOptions custom;
  custom.set_type(CONNECTION_TYPE_CUSTOM);
  (*custom.mutable_settings())["host"]     = "node.example:10009";
  (*custom.mutable_settings())["cert"]     = "/certs/tls.cert";
  (*custom.mutable_settings())["macaroon"] = "/certs/admin.macaroon";
  FinishOnboardingResponse finished;
  assert(f.FinishOnboarding(custom, &finished).ok());
  assert(finished.state() == LIFECYCLE_STATE_CONNECTED);

  Command req;
  req.set_channel("lnd");
  req.set_method("WalletBalance");
  (*req.mutable_payload()->mutable_fields())["account"].set_string_value("default");
  CommandResult resp;
  assert(f.Dispatch(req, &resp).ok());
  assert(!resp.dropped());
  assert(resp.ok());

  const auto lightning = f.sessions->Created(bolt::rpc::SessionKind::kLightning);
  assert(lightning.size() == 1);
  assert(lightning[0]->Invoked().size() == 1);
  assert(lightning[0]->Invoked()[0].rfind("WalletBalance ", 0) == 0);
}

void TestStartLightningWalletWhileOnboardingReturnsFailedPrecondition() {
  Fixture f("grpc_status_wallet");
  assert(f.StartOnboarding().ok());

  google::protobuf::Empty req;
  google::protobuf::Empty resp;
  ::grpc::ServerContext   grpc_ctx;
  assert(f.server->StartLightningWallet(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestErrorMapping() {
  assert(bolt::grpc::ToStatus(bolt::util::HostUnreachableError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(bolt::grpc::ToStatus(bolt::util::InvalidTransition("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(bolt::grpc::ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestFinishOnboardingBeforeOnboardingReturnsFailedPrecondition();
  TestInvalidOnboardingOptionsReturnInvalidArgument();
  TestSpawnFailureReturnsAborted();
  TestFinishOnboardingReportsNewState();
  TestUnknownChannelReturnsNotFound();
  TestCommandWithoutSessionIsDropped();
  TestCommandReachesConnectedNode();
  TestStartLightningWalletWhileOnboardingReturnsFailedPrecondition();
  TestErrorMapping();

  std::cout << "bolt_controller_unit_grpc_status: pass\n";
  return 0;
}
