#include "message_relay.hpp"

#include "bolt/controller/v1.hpp"
#include "internal/observability/logging.hpp"

namespace bolt::relay {

using bolt::observability::BoolField;
using bolt::observability::IntField;
using bolt::observability::StringField;

std::optional<Channel> ParseChannel(std::string_view name) {
  if (name == "walletUnlocker") {
    return Channel::kWalletUnlocker;
  }
  if (name == "lightning" || name == "lnd") {
    return Channel::kLightning;
  }
  return std::nullopt;
}

const char* ToString(Channel channel) {
  return channel == Channel::kWalletUnlocker ? "walletUnlocker" : "lightning";
}

rpc::SessionKind KindFor(Channel channel) {
  return channel == Channel::kWalletUnlocker ? rpc::SessionKind::kWalletUnlocker : rpc::SessionKind::kLightning;
}

void MessageRelay::AttachSink(std::shared_ptr<PresentationSink> sink) {
  std::lock_guard lock(push_mutex_);
  sink_ = std::move(sink);
}

void MessageRelay::DetachSink() {
  std::lock_guard lock(push_mutex_);
  sink_.reset();
}

void MessageRelay::Bind(Channel channel, std::shared_ptr<rpc::RpcSession> session) {
  std::lock_guard lock(routes_mutex_);
  routes_[static_cast<std::size_t>(channel)] = std::move(session);
}

void MessageRelay::Unbind(Channel channel) {
  std::lock_guard lock(routes_mutex_);
  routes_[static_cast<std::size_t>(channel)].reset();
}

std::shared_ptr<rpc::RpcSession> MessageRelay::Bound(Channel channel) const {
  std::lock_guard lock(routes_mutex_);
  return routes_[static_cast<std::size_t>(channel)];
}

void MessageRelay::SetUnlockObserver(UnlockObserver observer) {
  std::lock_guard lock(routes_mutex_);
  unlock_observer_ = std::move(observer);
}

std::optional<rpc::InvokeResult> MessageRelay::Dispatch(Channel channel, const std::string& method, const std::string& payload_json) {
  std::lock_guard call_lock(call_mutex_[static_cast<std::size_t>(channel)]);

  std::shared_ptr<rpc::RpcSession> session;
  UnlockObserver                   observer;
  {
    std::lock_guard lock(routes_mutex_);
    session  = routes_[static_cast<std::size_t>(channel)];
    observer = unlock_observer_;
  }

  if (!session || !session->CanDisconnect()) {
    BOLT_LOG_WARN("Dropping command, no active session", {StringField("channel", ToString(channel)), StringField("method", method)});
    return std::nullopt;
  }

  auto result = session->Invoke(method, payload_json);

  BOLT_LOG_DEBUG("Relayed command", {StringField("channel", ToString(channel)), StringField("method", method),
                                     BoolField("ok", result.ok), IntField("code", result.code)});

  if (result.ok && channel == Channel::kWalletUnlocker && (method == "UnlockWallet" || method == "InitWallet") && observer) {
    observer();
  }
  return result;
}

bool MessageRelay::Push(const std::string& name, google::protobuf::Value data) {
  std::lock_guard lock(push_mutex_);

  if (!sink_) {
    BOLT_LOG_WARN("Discarding notification, presentation boundary unavailable", {StringField("name", name)});
    return false;
  }

  bolt::controller::v1::Notification notification;
  notification.set_name(name);
  *notification.mutable_data() = std::move(data);
  notification.set_sequence(++sequence_);

  if (!sink_->Deliver(notification)) {
    BOLT_LOG_WARN("Discarding notification, presentation boundary unavailable", {StringField("name", name)});
    return false;
  }

  BOLT_LOG_INFO("Sent notification", {StringField("name", name), IntField("sequence", static_cast<std::int64_t>(notification.sequence()))});
  return true;
}

google::protobuf::Value NullValue() {
  google::protobuf::Value value;
  value.set_null_value(google::protobuf::NULL_VALUE);
  return value;
}

google::protobuf::Value StringValue(const std::string& value) {
  google::protobuf::Value result;
  result.set_string_value(value);
  return result;
}

google::protobuf::Value NumberValue(double value) {
  google::protobuf::Value result;
  result.set_number_value(value);
  return result;
}

} // namespace bolt::relay
