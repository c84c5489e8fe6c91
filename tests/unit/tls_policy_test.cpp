#include "internal/rpc/tls_policy.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "internal/rpc/connect_options.hpp"

namespace {

using bolt::profile::ConnectionProfile;
using bolt::profile::ConnectionType;
using bolt::rpc::TlsPolicy;

void TestDefaultSuitesPerConnectionType() {
  TlsPolicy policy;
  assert(!policy.HasExternalPreference());
  assert(policy.CipherSuitesFor(ConnectionType::kLocal) == bolt::rpc::kDefaultCipherSuites);
  assert(policy.CipherSuitesFor(ConnectionType::kCustom) == bolt::rpc::kDefaultCipherSuites);
  assert(policy.CipherSuitesFor(ConnectionType::kHostedService) == bolt::rpc::kHostedServiceCipherSuites);
}

void TestExternalPreferenceWins() {
  TlsPolicy policy(std::string("HIGH+ECDSA"));
  assert(policy.HasExternalPreference());
  assert(policy.CipherSuitesFor(ConnectionType::kLocal) == "HIGH+ECDSA");
  assert(policy.CipherSuitesFor(ConnectionType::kHostedService) == "HIGH+ECDSA");
}

void TestFromEnvironment() {
  ::unsetenv(bolt::rpc::kCipherSuitesEnv);
  assert(!TlsPolicy::FromEnvironment().HasExternalPreference());

  ::setenv(bolt::rpc::kCipherSuitesEnv, "HIGH", 1);
  auto policy = TlsPolicy::FromEnvironment();
  assert(policy.HasExternalPreference());
  assert(policy.CipherSuitesFor(ConnectionType::kCustom) == "HIGH");
  ::unsetenv(bolt::rpc::kCipherSuitesEnv);
}

void TestApplyOnlyOnce() {
  ::unsetenv(bolt::rpc::kCipherSuitesEnv);

  // An empty preference does not use up the one export.
  assert(!bolt::rpc::ApplyCipherSuitesOnce(""));
  assert(std::getenv(bolt::rpc::kCipherSuitesEnv) == nullptr);

  assert(bolt::rpc::ApplyCipherSuitesOnce(bolt::rpc::kHostedServiceCipherSuites));
  assert(std::string(std::getenv(bolt::rpc::kCipherSuitesEnv)) == bolt::rpc::kHostedServiceCipherSuites);

  assert(!bolt::rpc::ApplyCipherSuitesOnce(bolt::rpc::kDefaultCipherSuites));
  assert(std::string(std::getenv(bolt::rpc::kCipherSuitesEnv)) == bolt::rpc::kHostedServiceCipherSuites);
}

void TestResolveEndpoints() {
  bolt::rpc::LocalNodeLayout layout;
  layout.lnd_dir = "/data/lnd";

  ConnectionProfile local(ConnectionType::kLocal, "bitcoin", "testnet", "wallet-1", {{"alias", "a"}, {"autopilot", "true"}});
  auto              endpoint = bolt::rpc::ResolveEndpoint(local, layout);
  assert(endpoint.host == "localhost:10009");
  assert(endpoint.cert_path == std::filesystem::path("/data/lnd/bitcoin/testnet/wallet-1/tls.cert"));
  assert(endpoint.macaroon_path ==
         std::filesystem::path("/data/lnd/bitcoin/testnet/wallet-1/data/chain/bitcoin/testnet/admin.macaroon"));
  assert(endpoint.macaroon_may_be_absent);

  ConnectionProfile custom(ConnectionType::kCustom, "bitcoin", "testnet", "wallet-1",
                           {{"host", "node:10009"}, {"cert", "/certs/tls.cert"}, {"macaroon", "0201abcd"}});
  endpoint = bolt::rpc::ResolveEndpoint(custom, layout);
  assert(endpoint.host == "node:10009");
  assert(endpoint.macaroon_hex == "0201abcd");
  assert(endpoint.macaroon_path.empty());
  assert(!endpoint.system_roots);
  assert(!endpoint.macaroon_may_be_absent);

  ConnectionProfile hosted(ConnectionType::kHostedService, "bitcoin", "mainnet", "wallet-1", {{"host", "pay.example:443"}, {"macaroon", "ff"}});
  endpoint = bolt::rpc::ResolveEndpoint(hosted, layout);
  assert(endpoint.system_roots);
  assert(endpoint.cert_path.empty());
  assert(endpoint.macaroon_hex == "ff");
}

void TestLooksLikeHex() {
  assert(bolt::rpc::LooksLikeHex("0aFF"));
  assert(!bolt::rpc::LooksLikeHex("abc"));
  assert(!bolt::rpc::LooksLikeHex("/tmp/admin.macaroon"));
  assert(!bolt::rpc::LooksLikeHex(""));
}

} // namespace

int main() {
  TestDefaultSuitesPerConnectionType();
  TestExternalPreferenceWins();
  TestFromEnvironment();
  TestApplyOnlyOnce();
  TestResolveEndpoints();
  TestLooksLikeHex();

  std::cout << "bolt_controller_unit_tls_policy: pass\n";
  return 0;
}
