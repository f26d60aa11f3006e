#pragma once

#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "internal/runtime/blocking_queue.hpp"

namespace cardposter::runtime {

/*
  Fixed set of threads draining one task queue.

  Tasks must report their own outcome (the export coordinator uses a
  completion queue); an exception escaping a task is logged and the
  worker keeps going.

  Stop() lets queued tasks finish, then joins. The destructor stops.
*/
class WorkerPool {
 public:
  using Task = std::function<void()>;

  WorkerPool(std::string name, size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // false when the pool is stopping
  bool Submit(Task task);

  void Stop();

  size_t Size() const {
    return threads_.size();
  }

 private:
  void Run();

  std::string              name_;
  BlockingQueue<Task>      queue_;
  std::vector<std::thread> threads_;
};

} // namespace cardposter::runtime
