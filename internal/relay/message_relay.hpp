#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/rpc/rpc_session.hpp"

namespace bolt::controller::v1 {
class Notification;
}

namespace bolt::relay {

enum class Channel : std::uint8_t {
  kWalletUnlocker = 0,
  kLightning      = 1,
};

inline constexpr std::size_t kChannelCount = 2;

// Accepts "walletUnlocker", "lightning" and the legacy "lnd".
std::optional<Channel> ParseChannel(std::string_view name);
const char*            ToString(Channel channel);
rpc::SessionKind       KindFor(Channel channel);

/*
  The presentation boundary as seen by the relay.
*/
class PresentationSink {
 public:
  virtual ~PresentationSink() = default;

  // false when the boundary is currently unavailable.
  virtual bool Deliver(const bolt::controller::v1::Notification& notification) = 0;
};

/*
  Routes inbound commands to the session bound on their channel and pushes
  outbound notifications to the presentation boundary.

  Commands on one channel are executed in arrival order. A command on a
  channel with no bound session is dropped with a warning. A notification
  pushed while the boundary is unavailable is logged and discarded.
*/
class MessageRelay {
 public:
  using UnlockObserver = std::function<void()>;

  void AttachSink(std::shared_ptr<PresentationSink> sink);
  void DetachSink();

  void                             Bind(Channel channel, std::shared_ptr<rpc::RpcSession> session);
  void                             Unbind(Channel channel);
  std::shared_ptr<rpc::RpcSession> Bound(Channel channel) const;

  // Called after a successful UnlockWallet or InitWallet.
  void SetUnlockObserver(UnlockObserver observer);

  // nullopt when the command was dropped.
  std::optional<rpc::InvokeResult> Dispatch(Channel channel, const std::string& method, const std::string& payload_json);

  // true when the boundary accepted the notification.
  bool Push(const std::string& name, google::protobuf::Value data);

 private:
  mutable std::mutex               routes_mutex_;
  std::shared_ptr<rpc::RpcSession> routes_[kChannelCount];
  UnlockObserver                   unlock_observer_;

  std::mutex call_mutex_[kChannelCount];

  std::mutex                        push_mutex_;
  std::shared_ptr<PresentationSink> sink_;
  std::uint64_t                     sequence_ = 0;
};

// Convenience builders for notification payloads.
google::protobuf::Value NullValue();
google::protobuf::Value StringValue(const std::string& value);
google::protobuf::Value NumberValue(double value);

} // namespace bolt::relay
