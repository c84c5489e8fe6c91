#pragma once

#include <optional>
#include <string>

#include "internal/profile/connection_profile.hpp"

namespace bolt::rpc {

inline constexpr const char* kCipherSuitesEnv = "GRPC_SSL_CIPHER_SUITES";

inline constexpr const char* kHostedServiceCipherSuites = "ECDHE-RSA-AES256-GCM-SHA384:ECDHE-RSA-AES128-GCM-SHA256";

inline constexpr const char* kDefaultCipherSuites =
    "ECDHE-ECDSA-AES128-GCM-SHA256:ECDHE-ECDSA-AES256-GCM-SHA384:ECDHE-ECDSA-AES128-CBC-SHA256:ECDHE-ECDSA-CHACHA20-POLY1305";

/*
  TLS cipher-suite preference for outbound node connections.

  Captured once at controller construction and passed by value into each
  connect call. An externally supplied preference always wins.
*/
class TlsPolicy {
 public:
  TlsPolicy() = default;
  explicit TlsPolicy(std::optional<std::string> external) : external_(std::move(external)) {
  }

  // Reads GRPC_SSL_CIPHER_SUITES from the process environment.
  static TlsPolicy FromEnvironment();

  std::string CipherSuitesFor(profile::ConnectionType type) const;

  bool HasExternalPreference() const {
    return external_.has_value();
  }

 private:
  std::optional<std::string> external_;
};

// Exports `suites` to the gRPC runtime. Only the first non-empty call per
// process has any effect, and it never overrides an external value.
// Returns true if this call exported the value.
bool ApplyCipherSuitesOnce(const std::string& suites);

} // namespace bolt::rpc
