#include "connect_options.hpp"

#include <cctype>

namespace bolt::rpc {

bool LooksLikeHex(const std::string& value) {
  if (value.empty() || value.size() % 2 != 0) return false;
  for (unsigned char c : value) {
    if (!std::isxdigit(c)) return false;
  }
  return true;
}

Endpoint ResolveEndpoint(const profile::ConnectionProfile& profile, const LocalNodeLayout& layout) {
  Endpoint endpoint;

  switch (profile.Type()) {
    case bolt::profile::ConnectionType::kLocal: {
      const auto wallet_dir  = profile.WalletDir(layout.lnd_dir);
      endpoint.host          = layout.rpc_listen;
      endpoint.cert_path     = wallet_dir / "tls.cert";
      endpoint.macaroon_path = wallet_dir / "data" / "chain" / profile.Currency() / profile.Network() / "admin.macaroon";
      endpoint.macaroon_may_be_absent = true;
      break;
    }

    case bolt::profile::ConnectionType::kCustom: {
      endpoint.host      = profile.Setting("host");
      endpoint.cert_path = profile.Setting("cert");

      const auto& macaroon = profile.Setting("macaroon");
      if (LooksLikeHex(macaroon) && !std::filesystem::exists(macaroon)) {
        endpoint.macaroon_hex = macaroon;
      } else {
        endpoint.macaroon_path = macaroon;
      }
      break;
    }

    case bolt::profile::ConnectionType::kHostedService:
      endpoint.host         = profile.Setting("host");
      endpoint.macaroon_hex = profile.Setting("macaroon");
      endpoint.system_roots = true;
      break;
  }

  return endpoint;
}

} // namespace bolt::rpc
