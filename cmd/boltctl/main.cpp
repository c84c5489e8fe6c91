#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "bolt/controller/v1.hpp"

using namespace bolt::controller::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  boltctl <addr> state\n"
            << "  boltctl <addr> onboard local <alias> [autopilot=true|false]\n"
            << "  boltctl <addr> onboard custom <host> <cert_path> <macaroon_path|hex>\n"
            << "  boltctl <addr> onboard hosted <host> <macaroon_hex>\n"
            << "  boltctl <addr> call <walletUnlocker|lightning> <method> [json_payload]\n"
            << "  boltctl <addr> watch\n"
            << "  boltctl <addr> start-wallet\n"
            << "  boltctl <addr> reset\n"
            << "  boltctl <addr> terminate\n";
}

static const char* StateName(LifecycleState state) {
  switch (state) {
    case LIFECYCLE_STATE_INIT:
      return "init";
    case LIFECYCLE_STATE_ONBOARDING:
      return "onboarding";
    case LIFECYCLE_STATE_RUNNING:
      return "running";
    case LIFECYCLE_STATE_CONNECTED:
      return "connected";
    case LIFECYCLE_STATE_TERMINATED:
      return "terminated";
    default:
      return "unspecified";
  }
}

static const char* TypeName(ConnectionType type) {
  switch (type) {
    case CONNECTION_TYPE_LOCAL:
      return "local";
    case CONNECTION_TYPE_CUSTOM:
      return "custom";
    case CONNECTION_TYPE_HOSTED_SERVICE:
      return "hostedService";
    default:
      return "none";
  }
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    return "<unprintable>";
  }
  return json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ControllerService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "state") {
    GetStateResponse resp;

    auto status = stub->GetState(&ctx, GetStateRequest(), &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "state=" << StateName(resp.state()) << " type=" << TypeName(resp.connection_type());
    if (!resp.alias().empty()) std::cout << " alias=" << resp.alias();
    if (!resp.host().empty()) std::cout << " host=" << resp.host();
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "onboard") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    std::string       kind = argv[3];
    OnboardingOptions req;
    auto&             settings = *req.mutable_settings();

    if (kind == "local") {
      req.set_type(CONNECTION_TYPE_LOCAL);
      settings["alias"]     = argv[4];
      settings["autopilot"] = argc >= 6 ? argv[5] : "true";
    } else if (kind == "custom" && argc >= 7) {
      req.set_type(CONNECTION_TYPE_CUSTOM);
      settings["host"]     = argv[4];
      settings["cert"]     = argv[5];
      settings["macaroon"] = argv[6];
    } else if (kind == "hosted" && argc >= 6) {
      req.set_type(CONNECTION_TYPE_HOSTED_SERVICE);
      settings["host"]     = argv[4];
      settings["macaroon"] = argv[5];
    } else {
      Usage();
      return 1;
    }

    FinishOnboardingResponse resp;

    auto status = stub->FinishOnboarding(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "state=" << StateName(resp.state()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "call") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    Command req;
    req.set_channel(argv[3]);
    req.set_method(argv[4]);
    if (argc >= 6) {
      auto parsed = google::protobuf::util::JsonStringToMessage(argv[5], req.mutable_payload());
      if (!parsed.ok()) {
        std::cerr << "invalid payload: " << parsed.message() << "\n";
        return 1;
      }
    }

    CommandResult resp;

    auto status = stub->Dispatch(&ctx, req, &resp);

    if (!status.ok()) {
      return Fail(status);
    }

    if (resp.dropped()) {
      std::cerr << "dropped: no active " << req.channel() << " session\n";
      return 3;
    }
    if (!resp.ok()) {
      std::cerr << "error " << resp.error_code() << ": " << resp.error_message() << "\n";
      return 2;
    }

    std::cout << ToJson(resp.result()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    auto reader = stub->WatchNotifications(&ctx, WatchRequest());

    Notification notification;
    while (reader->Read(&notification)) {
      std::cout << notification.sequence() << " " << notification.name() << " " << ToJson(notification.data()) << std::endl;
    }

    auto status = reader->Finish();
    if (!status.ok()) {
      return Fail(status);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start-wallet" || cmd == "reset" || cmd == "terminate") {
    google::protobuf::Empty req;
    google::protobuf::Empty resp;

    grpc::Status status;
    if (cmd == "start-wallet") {
      status = stub->StartLightningWallet(&ctx, req, &resp);
    } else if (cmd == "reset") {
      status = stub->StartOnboarding(&ctx, req, &resp);
    } else {
      status = stub->Terminate(&ctx, req, &resp);
    }

    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "ok\n";
    return 0;
  }

  Usage();
  return 1;
}
