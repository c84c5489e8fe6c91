#pragma once

#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "grpc_session.hpp"

namespace bolt::rpc {

/*
  Authenticated interface. Connect() calls GetInfo with the macaroon.
  Subscribe() forwards invoice and transaction streams until Disconnect().
*/
class LightningSession final : public GrpcSession {
 public:
  ~LightningSession() override;

  SessionKind Kind() const override {
    return SessionKind::kLightning;
  }

  void Subscribe(PushSink sink) override;

 protected:
  const char* ServiceName() const override {
    return "lnrpc.Lightning";
  }

  void Handshake(const std::shared_ptr<::grpc::Channel>& channel, const ConnectOptions& options) override;
  void OnDisconnect() override;

 private:
  struct Stream {
    std::unique_ptr<::grpc::ClientContext> context;
    std::thread                            worker;
  };

  void StopStreams();

  std::mutex          streams_mutex_;
  std::vector<Stream> streams_;
};

} // namespace bolt::rpc
