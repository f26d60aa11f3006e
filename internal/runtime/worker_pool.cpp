#include "worker_pool.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace cardposter::runtime {

WorkerPool::WorkerPool(std::string name, size_t threads) : name_(std::move(name)) {
  threads = std::max<size_t>(threads, 1);
  threads_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

bool WorkerPool::Submit(Task task) {
  return queue_.Push(std::move(task));
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_.Pop();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      CARDPOSTER_LOG_ERROR("worker task failed", {observability::StringField("pool", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace cardposter::runtime
