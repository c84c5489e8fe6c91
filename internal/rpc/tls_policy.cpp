#include "tls_policy.hpp"

#include <cstdlib>
#include <mutex>

#include "internal/observability/logging.hpp"

namespace bolt::rpc {

using bolt::observability::StringField;

TlsPolicy TlsPolicy::FromEnvironment() {
  if (const char* value = std::getenv(kCipherSuitesEnv); value != nullptr && *value != '\0') {
    return TlsPolicy(std::string(value));
  }
  return TlsPolicy();
}

std::string TlsPolicy::CipherSuitesFor(profile::ConnectionType type) const {
  if (external_) {
    return *external_;
  }
  if (type == profile::ConnectionType::kHostedService) {
    return kHostedServiceCipherSuites;
  }
  return kDefaultCipherSuites;
}

bool ApplyCipherSuitesOnce(const std::string& suites) {
  static std::mutex mutex;
  static bool       applied = false;

  if (suites.empty()) {
    return false;
  }

  std::lock_guard lock(mutex);
  if (applied) {
    return false;
  }
  applied = true;

  if (const char* external = std::getenv(kCipherSuitesEnv); external != nullptr && *external != '\0') {
    BOLT_LOG_INFO("Using externally supplied TLS cipher suites");
    return false;
  }
  if (::setenv(kCipherSuitesEnv, suites.c_str(), 0) != 0) {
    BOLT_LOG_WARN("Failed to export TLS cipher suites", {StringField("env", kCipherSuitesEnv)});
    return false;
  }
  BOLT_LOG_INFO("Exported TLS cipher suites", {StringField("suites", suites)});
  return true;
}

} // namespace bolt::rpc
