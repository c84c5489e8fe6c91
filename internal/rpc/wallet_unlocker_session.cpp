#include "wallet_unlocker_session.hpp"

#include "bolt/controller/v1.hpp"
#include "internal/util/errors.hpp"

namespace bolt::rpc {

void WalletUnlockerSession::Handshake(const std::shared_ptr<::grpc::Channel>& channel, const ConnectOptions& options) {
  // Touch the generated stub so the WalletUnlocker descriptors are linked in.
  (void)lnrpc::WalletUnlocker::service_full_name();

  const auto deadline = std::chrono::system_clock::now() + options.connect_timeout;
  if (!channel->WaitForConnected(deadline)) {
    throw util::HostUnreachableError("Unable to connect to host: " + options.endpoint.host);
  }
}

} // namespace bolt::rpc
