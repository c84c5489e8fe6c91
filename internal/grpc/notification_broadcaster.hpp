#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "bolt/controller/v1.hpp"
#include "internal/relay/message_relay.hpp"
#include "internal/util/blocking_queue.hpp"

namespace bolt::grpc {

using NotificationQueue = bolt::util::BlockingQueue<bolt::controller::v1::Notification>;

/*
  Fans relay notifications out to every attached watcher stream.

  The presentation boundary counts as available while at least one watcher
  is attached. Each watcher keeps at most `backlog` undelivered
  notifications; a stalled watcher loses its oldest ones.
*/
class NotificationBroadcaster final : public bolt::relay::PresentationSink {
 public:
  static constexpr std::size_t kDefaultBacklog = 1024;

  explicit NotificationBroadcaster(std::size_t backlog = kDefaultBacklog) : backlog_(backlog) {
  }

  bool Deliver(const bolt::controller::v1::Notification& notification) override;

  std::shared_ptr<NotificationQueue> Attach();
  void                               Detach(const std::shared_ptr<NotificationQueue>& watcher);

  // Ends every watcher stream.
  void Close();

  std::size_t WatcherCount() const;

 private:
  const std::size_t                               backlog_;
  mutable std::mutex                              mutex_;
  std::vector<std::shared_ptr<NotificationQueue>> watchers_;
};

} // namespace bolt::grpc
