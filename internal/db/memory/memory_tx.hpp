#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_cache_index.hpp"

namespace cardposter::db::memory {

/*
  Transaction = snapshot + write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryCacheIndex& index);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  State state() const override {
    return state_;
  }

  MemoryCacheIndex::State& Mutable() {
    return working_;
  }
  const MemoryCacheIndex::State& View() const {
    return working_;
  }

 private:
  MemoryCacheIndex&       index_;
  MemoryCacheIndex::State working_;
  uint64_t                snapshot_version_ = 0;
  State                   state_            = State::kOpen;
};

} // namespace cardposter::db::memory
