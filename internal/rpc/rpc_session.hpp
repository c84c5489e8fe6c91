#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "connect_options.hpp"
#include "internal/profile/connection_profile.hpp"
#include "internal/util/errors.hpp"

namespace bolt::rpc {

enum class SessionKind {
  kWalletUnlocker,
  kLightning,
};

inline std::string_view ToString(SessionKind kind) {
  return kind == SessionKind::kWalletUnlocker ? "walletUnlocker" : "lightning";
}

// Outcome of a generic remote call, relayed verbatim to the caller.
struct InvokeResult {
  bool        ok = false;
  std::string json;  // response message as JSON when ok
  int         code = 0;  // grpc::StatusCode when !ok
  std::string message;
};

// Receives push events: (event name, JSON payload).
using PushSink = std::function<void(std::string_view event, const std::string& json)>;

/*
  One client connection to the node, either the unauthenticated wallet
  unlocker interface or the authenticated lightning interface.
*/
class RpcSession {
 public:
  virtual ~RpcSession() = default;

  virtual SessionKind Kind() const = 0;

  // Throws a ConnectError subtype on failure.
  virtual void Connect(const profile::ConnectionProfile& profile, const ConnectOptions& options) = 0;

  virtual InvokeResult Invoke(const std::string& method, const std::string& payload_json) = 0;

  // Forwards node push events to `sink` until Disconnect().
  virtual void Subscribe(PushSink sink) {
    (void)sink;
    throw util::InvalidState(std::string(ToString(Kind())) + " session does not support subscriptions");
  }

  virtual bool CanDisconnect() const = 0;

  // Idempotent.
  virtual void Disconnect() = 0;
};

class SessionFactory {
 public:
  virtual ~SessionFactory() = default;

  virtual std::shared_ptr<RpcSession> Create(SessionKind kind) = 0;
};

} // namespace bolt::rpc
