#include "memory_tx.hpp"

#include <stdexcept>

namespace cardposter::db::memory {

MemoryTransaction::MemoryTransaction(MemoryCacheIndex& index) : index_(index) {
  std::scoped_lock lock(index_.mutex_);
  working_          = index_.committed_; // snapshot copy
  snapshot_version_ = index_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (state_ == State::kOpen) Rollback();
}

void MemoryTransaction::Commit() {
  if (state_ != State::kOpen) throw std::logic_error("cache index transaction already finished");
  std::scoped_lock lock(index_.mutex_);
  if (index_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: cache index was modified by a concurrent transaction");
  }
  index_.committed_ = std::move(working_);
  index_.committed_version_++;
  state_ = State::kCommitted;
}

void MemoryTransaction::Rollback() {
  if (state_ == State::kOpen) state_ = State::kRolledBack;
}

} // namespace cardposter::db::memory
