#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace cardposter::runtime {

/*
  Thread-safe blocking FIFO.

  After Shutdown() producers are rejected and consumers drain what is
  left, then receive nullopt.
*/
template <typename T>
class BlockingQueue {
 public:
  // false when the queue is shut down
  bool Push(T item) {
    {
      std::lock_guard lock(mutex_);
      if (shutdown_) return false;
      queue_.push(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

  size_t Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<T>           queue_;
  bool                    shutdown_ = false;
};

} // namespace cardposter::runtime
