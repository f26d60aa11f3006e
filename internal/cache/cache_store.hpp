#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/cache/cache_key.hpp"
#include "internal/db/api/cache_index.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/util/time.hpp"

namespace cardposter::cache {

using CacheEntry = db::model::CacheEntryRecord;

struct CacheOptions {
  // 0 = unbounded
  uint64_t max_bytes = 0;
  // 0 = entries never go stale by age
  uint32_t ttl_days = 0;
  bool     fsync    = false;
};

struct CacheStats {
  uint64_t active_entries  = 0;
  uint64_t stale_entries   = 0;
  uint64_t evicted_entries = 0;
  uint64_t active_bytes    = 0;
};

struct EvictionReport {
  uint64_t entries     = 0;
  uint64_t bytes_freed = 0;
};

/*
  Content-addressed image cache.

  Index rows (CacheIndex) say which blob (BlobStore) holds the current
  bytes of a key. Ordering rules:

    Put:    blob write → index commit → old blob removal
    Lookup: index row → blob existence → touch

  so a lookup never observes a row whose blob is half written, and a
  superseded blob disappears only once no committed row points at it.

  All methods are safe to call from worker threads. Index transactions
  are serialized by a store-level mutex; blob I/O for reads runs outside it.

  Errors: index/blob failures surface as util::StorageError. Put raises
  util::CacheFull when the blob alone exceeds max_bytes and
  util::CacheWriteError when the blob or the row cannot be written.
*/
class CacheStore {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  CacheStore(std::shared_ptr<db::CacheIndex> index, storage::BlobStorePtr blobs, CacheOptions options, ClockFn clock = util::Now);

  // Never touches the network. Hit updates last-accessed and access count.
  std::optional<CacheEntry> Lookup(const CacheKey& key);

  CacheEntry Put(const CacheKey& key, const std::string& source_url, const std::shared_ptr<arrow::Buffer>& bytes,
                 const std::string& content_hash);

  std::shared_ptr<arrow::Buffer> Read(const CacheEntry& entry);

  // Marks the entry stale; returns false when the key is unknown.
  bool Invalidate(const CacheKey& key);

  CacheStats Stats();

  // Deletes entries not accessed since cutoff, with their blobs.
  EvictionReport EvictOlderThan(util::TimePoint cutoff);

  void Clear();

  const CacheOptions& Options() const {
    return options_;
  }

 private:
  static std::string BlobName(const CacheKey& key, const std::string& content_hash);

  // Marks least-recently-accessed active entries evicted until incoming_bytes fits.
  // Returns blob names to remove after commit.
  std::vector<std::string> MakeRoom(db::Transaction& tx, const CacheKey& key, uint64_t incoming_bytes);

  void RemoveBlobQuietly(const std::string& name);

  std::shared_ptr<db::CacheIndex> index_;
  storage::BlobStorePtr           blobs_;
  CacheOptions                    options_;
  ClockFn                         clock_;

  std::mutex mutex_;
};

} // namespace cardposter::cache
