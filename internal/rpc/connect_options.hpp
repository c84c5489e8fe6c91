#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "internal/profile/connection_profile.hpp"

namespace bolt::rpc {

// Where a locally spawned node keeps its RPC endpoint and credentials.
struct LocalNodeLayout {
  std::filesystem::path lnd_dir;
  std::string           rpc_listen = "localhost:10009";
};

struct Endpoint {
  std::string           host;
  std::filesystem::path cert_path;     // empty when system roots are used
  std::filesystem::path macaroon_path; // empty when macaroon_hex is set
  std::string           macaroon_hex;
  bool                  system_roots = false;
  // A fresh local node only writes its macaroon once a wallet exists.
  bool                  macaroon_may_be_absent = false;
};

struct ConnectOptions {
  Endpoint                  endpoint;
  // Exported to the gRPC runtime by the first connect of the process.
  std::string               cipher_suites;
  std::chrono::milliseconds connect_timeout{10'000};
  std::chrono::milliseconds call_timeout{60'000};
};

/*
  Derives endpoint and credential locations from a profile.

  local:          rpc_listen, <wallet dir>/tls.cert,
                  <wallet dir>/data/chain/<currency>/<network>/admin.macaroon
  custom:         host, cert path, macaroon path or hex token
  hostedService:  host, system trust roots, hex macaroon token
*/
Endpoint ResolveEndpoint(const profile::ConnectionProfile& profile, const LocalNodeLayout& layout);

bool LooksLikeHex(const std::string& value);

} // namespace bolt::rpc
