#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace bolt::util {

/*
  Thread-safe blocking queue. Single or multi consumer.

  After Shutdown() consumers drain the remaining items, then receive nullopt.
  Enqueue after Shutdown() is rejected. A bounded queue drops its oldest
  item to make room.
*/
template <typename T>
class BlockingQueue {
 public:
  // 0 means unbounded.
  explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {
  }

  bool Enqueue(T item) {
    {
      std::lock_guard lock(mutex_);
      if (shutdown_) return false;
      if (capacity_ > 0 && queue_.size() >= capacity_) {
        queue_.pop();
        ++dropped_;
      }
      queue_.push(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Dequeue() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    return PopLocked();
  }

  // nullopt on timeout or shutdown
  template <typename Rep, typename Period>
  std::optional<T> DequeueFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);

    if (!cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); })) {
      return std::nullopt;
    }

    return PopLocked();
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

  bool IsShutdown() const {
    std::lock_guard lock(mutex_);
    return shutdown_;
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  // Items discarded because the queue was full.
  std::size_t Dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  std::optional<T> PopLocked() {
    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<T>           queue_;
  std::size_t             capacity_ = 0;
  std::size_t             dropped_  = 0;
  bool                    shutdown_ = false;
};

} // namespace bolt::util
