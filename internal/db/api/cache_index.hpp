#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_entry_record.hpp"

namespace cardposter::db {

/*
  Cache index abstraction.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A row is visible to other transactions only after Commit()
  - Get/List throw std::runtime_error when the backend fails; writes
    report failures through Result

  The index is the source of truth for which blob holds the current
  version of a key. Blobs without a row are garbage.
*/

class CacheIndex {
 public:
  virtual ~CacheIndex() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::optional<model::CacheEntryRecord> Get(Transaction&, const std::string& key) = 0;

  virtual std::vector<model::CacheEntryRecord> List(Transaction&) = 0;

  // Inserts or fully replaces the row for record.key.
  virtual Result Upsert(Transaction&, const model::CacheEntryRecord&) = 0;

  // last_accessed_ms = accessed_at_ms, access_count += 1
  virtual Result Touch(Transaction&, const std::string& key, uint64_t accessed_at_ms) = 0;

  virtual Result SetStatus(Transaction&, const std::string& key, model::CacheStatus status) = 0;

  virtual Result Delete(Transaction&, const std::string& key) = 0;
};

} // namespace cardposter::db
