#include "notification_broadcaster.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace bolt::grpc {

using bolt::observability::IntField;
using bolt::observability::StringField;

bool NotificationBroadcaster::Deliver(const bolt::controller::v1::Notification& notification) {
  std::lock_guard lock(mutex_);

  bool delivered = false;
  for (const auto& watcher : watchers_) {
    if (backlog_ > 0 && watcher->Size() >= backlog_) {
      BOLT_LOG_WARN("Watcher backlog full, dropping oldest notification",
                    {StringField("name", notification.name()), IntField("backlog", static_cast<std::int64_t>(backlog_))});
    }
    delivered = watcher->Enqueue(notification) || delivered;
  }
  return delivered;
}

std::shared_ptr<NotificationQueue> NotificationBroadcaster::Attach() {
  auto watcher = std::make_shared<NotificationQueue>(backlog_);

  std::lock_guard lock(mutex_);
  watchers_.push_back(watcher);
  return watcher;
}

void NotificationBroadcaster::Detach(const std::shared_ptr<NotificationQueue>& watcher) {
  watcher->Shutdown();

  std::lock_guard lock(mutex_);
  watchers_.erase(std::remove(watchers_.begin(), watchers_.end(), watcher), watchers_.end());
}

void NotificationBroadcaster::Close() {
  std::vector<std::shared_ptr<NotificationQueue>> watchers;
  {
    std::lock_guard lock(mutex_);
    watchers.swap(watchers_);
  }
  for (const auto& watcher : watchers) {
    watcher->Shutdown();
  }
}

std::size_t NotificationBroadcaster::WatcherCount() const {
  std::lock_guard lock(mutex_);
  return watchers_.size();
}

} // namespace bolt::grpc
