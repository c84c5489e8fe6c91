#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <grpcpp/grpcpp.h>

#include "rpc_session.hpp"

namespace bolt::rpc {

/*
  Shared gRPC plumbing for both node interfaces.

  Connect() loads TLS material and the macaroon, opens a secure channel and
  runs the subclass handshake. Invoke() dispatches by method name through the
  generated descriptor pool, so any unary method of the service can be
  relayed without per-method code.
*/
class GrpcSession : public RpcSession {
 public:
  void         Connect(const profile::ConnectionProfile& profile, const ConnectOptions& options) override;
  InvokeResult Invoke(const std::string& method, const std::string& payload_json) override;
  bool         CanDisconnect() const override;
  void         Disconnect() override;

 protected:
  // Fully qualified service name, e.g. "lnrpc.Lightning".
  virtual const char* ServiceName() const = 0;

  // Confirms the interface is reachable. Throws a ConnectError subtype.
  virtual void Handshake(const std::shared_ptr<::grpc::Channel>& channel, const ConnectOptions& options) = 0;

  // Called by Disconnect() before the channel is released.
  virtual void OnDisconnect() {
  }

  // Attaches the macaroon and a deadline to an outgoing call.
  void PrepareContext(::grpc::ClientContext* context, std::chrono::milliseconds timeout) const;

  std::shared_ptr<::grpc::Channel> Channel() const;

 private:
  mutable std::mutex               mutex_;
  std::shared_ptr<::grpc::Channel> channel_;
  std::string                      macaroon_hex_;
  std::chrono::milliseconds        call_timeout_{60'000};
};

std::string HexEncode(const std::string& bytes);

} // namespace bolt::rpc
