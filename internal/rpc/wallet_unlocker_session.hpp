#pragma once

#include "grpc_session.hpp"

namespace bolt::rpc {

// Pre-authentication interface used to create or unlock a wallet.
class WalletUnlockerSession final : public GrpcSession {
 public:
  SessionKind Kind() const override {
    return SessionKind::kWalletUnlocker;
  }

 protected:
  const char* ServiceName() const override {
    return "lnrpc.WalletUnlocker";
  }

  void Handshake(const std::shared_ptr<::grpc::Channel>& channel, const ConnectOptions& options) override;
};

} // namespace bolt::rpc
