#pragma once

#include <atomic>

namespace cardposter::runtime {

/*
  Cooperative cancellation flag shared by a job and its workers.
  Cancel() is sticky.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace cardposter::runtime
