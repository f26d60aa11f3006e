#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/cache_index.hpp"

namespace cardposter::db::memory {

class MemoryTransaction;

/*
  In-process cache index. Used by tests and by the `memory` index config.
  Nothing survives the process.
*/
class MemoryCacheIndex final : public db::CacheIndex {
 public:
  MemoryCacheIndex();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::CacheEntryRecord> Get(Transaction&, const std::string& key) override;
  std::vector<model::CacheEntryRecord>   List(Transaction&) override;

  Result Upsert(Transaction&, const model::CacheEntryRecord&) override;
  Result Touch(Transaction&, const std::string& key, uint64_t accessed_at_ms) override;
  Result SetStatus(Transaction&, const std::string& key, model::CacheStatus status) override;
  Result Delete(Transaction&, const std::string& key) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::CacheEntryRecord> entries;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace cardposter::db::memory
