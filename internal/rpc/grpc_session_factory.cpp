#include "grpc_session_factory.hpp"

#include "lightning_session.hpp"
#include "wallet_unlocker_session.hpp"

namespace bolt::rpc {

std::shared_ptr<RpcSession> GrpcSessionFactory::Create(SessionKind kind) {
  switch (kind) {
    case SessionKind::kWalletUnlocker:
      return std::make_shared<WalletUnlockerSession>();
    case SessionKind::kLightning:
      return std::make_shared<LightningSession>();
  }
  return nullptr;
}

} // namespace bolt::rpc
