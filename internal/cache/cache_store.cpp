#include "cache_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cardposter::cache {

using db::model::CacheStatus;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint64_t kMillisPerDay = 24ull * 60 * 60 * 1000;

// hash prefix keeps successive versions of one key in distinct blobs
constexpr size_t kBlobHashPrefix = 16;

template <typename Error = util::StorageError>
void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  const std::string code = db::ErrorCodeName(result.code);
  throw Error(result.message.empty() ? context + " (" + code + ")" : context + " (" + code + "): " + result.message);
}

} // namespace

CacheStore::CacheStore(std::shared_ptr<db::CacheIndex> index, storage::BlobStorePtr blobs, CacheOptions options, ClockFn clock)
    : index_(std::move(index)), blobs_(std::move(blobs)), options_(options), clock_(std::move(clock)) {
  if (!index_ || !blobs_) {
    throw std::invalid_argument("cache store requires an index and a blob store");
  }
}

std::string CacheStore::BlobName(const CacheKey& key, const std::string& content_hash) {
  return key + "-" + content_hash.substr(0, kBlobHashPrefix);
}

void CacheStore::RemoveBlobQuietly(const std::string& name) {
  try {
    blobs_->Remove(name);
  } catch (const std::exception& e) {
    // orphaned blob; Clear() picks it up
    CARDPOSTER_LOG_WARN("cache blob removal failed", {StringField("blob", name), StringField("error", e.what())});
  }
}

std::optional<CacheEntry> CacheStore::Lookup(const CacheKey& key) {
  const auto now_ms = util::ToUnixMillis(clock_());

  std::scoped_lock lock(mutex_);
  try {
    auto tx    = index_->Begin();
    auto entry = index_->Get(*tx, key);
    if (!entry || entry->status != CacheStatus::kActive) {
      tx->Rollback();
      return std::nullopt;
    }

    const uint64_t ttl_ms = static_cast<uint64_t>(options_.ttl_days) * kMillisPerDay;
    if (ttl_ms > 0 && now_ms > entry->fetched_at_ms && now_ms - entry->fetched_at_ms > ttl_ms) {
      ThrowIfDbError(index_->SetStatus(*tx, key, CacheStatus::kStale), "mark cache entry stale");
      tx->Commit();
      CARDPOSTER_LOG_DEBUG("cache entry expired", {StringField("key", key), IntField("fetched_at_ms", static_cast<int64_t>(entry->fetched_at_ms))});
      return std::nullopt;
    }

    if (!blobs_->Exists(entry->blob_ref)) {
      ThrowIfDbError(index_->SetStatus(*tx, key, CacheStatus::kEvicted), "mark cache entry evicted");
      tx->Commit();
      CARDPOSTER_LOG_WARN("cache blob missing, entry evicted", {StringField("key", key), StringField("blob", entry->blob_ref)});
      return std::nullopt;
    }

    ThrowIfDbError(index_->Touch(*tx, key, now_ms), "touch cache entry");
    tx->Commit();

    entry->last_accessed_ms = now_ms;
    entry->access_count++;
    return entry;
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw util::StorageError(std::string("cache lookup: ") + e.what());
  }
}

std::vector<std::string> CacheStore::MakeRoom(db::Transaction& tx, const CacheKey& key, uint64_t incoming_bytes) {
  // List() is ordered least recently accessed first
  auto entries = index_->List(tx);

  uint64_t used = 0;
  for (const auto& e : entries) {
    if (e.status != CacheStatus::kEvicted && e.key != key) used += e.size_bytes;
  }

  std::vector<std::string> freed;
  for (const auto& e : entries) {
    if (used + incoming_bytes <= options_.max_bytes) break;
    if (e.status == CacheStatus::kEvicted || e.key == key) continue;

    ThrowIfDbError<util::CacheWriteError>(index_->SetStatus(tx, e.key, CacheStatus::kEvicted), "evict cache entry");
    used -= e.size_bytes;
    freed.push_back(e.blob_ref);
  }
  return freed;
}

CacheEntry CacheStore::Put(const CacheKey& key, const std::string& source_url, const std::shared_ptr<arrow::Buffer>& bytes,
                           const std::string& content_hash) {
  if (!bytes) {
    throw std::invalid_argument("cache put: bytes must not be null");
  }
  if (content_hash.empty()) {
    throw std::invalid_argument("cache put: content hash must not be empty");
  }

  const auto size = static_cast<uint64_t>(bytes->size());
  if (options_.max_bytes > 0 && size > options_.max_bytes) {
    throw util::CacheFull("cache put: blob of " + std::to_string(size) + " bytes exceeds cache capacity of " +
                          std::to_string(options_.max_bytes) + " bytes");
  }

  const auto now_ms    = util::ToUnixMillis(clock_());
  const auto blob_name = BlobName(key, content_hash);

  std::scoped_lock lock(mutex_);

  std::optional<CacheEntry> previous;
  std::vector<std::string>  evicted_blobs;
  CacheEntry                record;
  bool                      wrote_new_blob = false;

  try {
    auto tx  = index_->Begin();
    previous = index_->Get(*tx, key);

    const bool same_content = previous && previous->content_hash == content_hash && previous->blob_ref == blob_name;

    // blob first: the row must never point at bytes that are not there yet
    if (!same_content || !blobs_->Exists(blob_name)) {
      blobs_->Write(blob_name, bytes, options_.fsync);
      wrote_new_blob = !same_content;
    }

    if (options_.max_bytes > 0) {
      evicted_blobs = MakeRoom(*tx, key, size);
    }

    record.key              = key;
    record.source_url       = source_url;
    record.blob_ref         = blob_name;
    record.content_hash     = content_hash;
    record.size_bytes       = size;
    record.fetched_at_ms    = now_ms;
    record.last_accessed_ms = now_ms;
    record.access_count     = previous ? previous->access_count : 0;
    record.version          = !previous ? 1 : (same_content ? previous->version : previous->version + 1);
    record.status           = CacheStatus::kActive;

    ThrowIfDbError<util::CacheWriteError>(index_->Upsert(*tx, record), "put cache entry");
    tx->Commit();
  } catch (const util::StorageError&) {
    if (wrote_new_blob) RemoveBlobQuietly(blob_name);
    throw;
  } catch (const std::runtime_error& e) {
    if (wrote_new_blob) RemoveBlobQuietly(blob_name);
    throw util::CacheWriteError(std::string("cache put: ") + e.what());
  }

  // superseded version: safe to drop now that no committed row points at it
  if (previous && previous->blob_ref != blob_name) {
    RemoveBlobQuietly(previous->blob_ref);
    CARDPOSTER_LOG_DEBUG("cache entry superseded",
                         {StringField("key", key), IntField("version", static_cast<int64_t>(record.version))});
  }

  for (const auto& name : evicted_blobs) {
    RemoveBlobQuietly(name);
  }
  if (!evicted_blobs.empty()) {
    CARDPOSTER_LOG_INFO("cache capacity eviction", {IntField("entries", static_cast<int64_t>(evicted_blobs.size())),
                                                    IntField("max_bytes", static_cast<int64_t>(options_.max_bytes))});
  }

  return record;
}

std::shared_ptr<arrow::Buffer> CacheStore::Read(const CacheEntry& entry) {
  return blobs_->Read(entry.blob_ref);
}

bool CacheStore::Invalidate(const CacheKey& key) {
  std::scoped_lock lock(mutex_);
  try {
    auto tx    = index_->Begin();
    auto entry = index_->Get(*tx, key);
    if (!entry) {
      tx->Rollback();
      return false;
    }
    ThrowIfDbError(index_->SetStatus(*tx, key, CacheStatus::kStale), "invalidate cache entry");
    tx->Commit();
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw util::StorageError(std::string("cache invalidate: ") + e.what());
  }

  CARDPOSTER_LOG_INFO("cache entry invalidated", {StringField("key", key)});
  return true;
}

CacheStats CacheStore::Stats() {
  std::vector<CacheEntry> entries;
  {
    std::scoped_lock lock(mutex_);
    try {
      auto tx = index_->Begin();
      entries = index_->List(*tx);
      tx->Rollback();
    } catch (const std::runtime_error& e) {
      throw util::StorageError(std::string("cache stats: ") + e.what());
    }
  }

  CacheStats stats;
  for (const auto& e : entries) {
    switch (e.status) {
      case CacheStatus::kActive:
        stats.active_entries++;
        stats.active_bytes += e.size_bytes;
        break;
      case CacheStatus::kStale:
        stats.stale_entries++;
        break;
      case CacheStatus::kEvicted:
        stats.evicted_entries++;
        break;
    }
  }
  return stats;
}

EvictionReport CacheStore::EvictOlderThan(util::TimePoint cutoff) {
  const auto cutoff_ms = util::ToUnixMillis(cutoff);

  EvictionReport           report;
  std::vector<std::string> freed;

  std::scoped_lock lock(mutex_);
  try {
    auto tx = index_->Begin();
    for (const auto& e : index_->List(*tx)) {
      if (e.last_accessed_ms >= cutoff_ms) continue;

      ThrowIfDbError(index_->Delete(*tx, e.key), "delete cache entry");
      report.entries++;
      if (e.status != CacheStatus::kEvicted) {
        report.bytes_freed += e.size_bytes;
        freed.push_back(e.blob_ref);
      }
    }
    tx->Commit();
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw util::StorageError(std::string("cache cleanup: ") + e.what());
  }

  for (const auto& name : freed) {
    RemoveBlobQuietly(name);
  }

  CARDPOSTER_LOG_INFO("cache cleanup", {IntField("entries", static_cast<int64_t>(report.entries)),
                                        IntField("bytes_freed", static_cast<int64_t>(report.bytes_freed))});
  return report;
}

void CacheStore::Clear() {
  std::scoped_lock lock(mutex_);
  uint64_t         removed = 0;
  try {
    auto tx = index_->Begin();
    for (const auto& e : index_->List(*tx)) {
      ThrowIfDbError(index_->Delete(*tx, e.key), "delete cache entry");
      removed++;
    }
    tx->Commit();
  } catch (const util::StorageError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw util::StorageError(std::string("cache clear: ") + e.what());
  }

  blobs_->RemoveAll();
  CARDPOSTER_LOG_INFO("cache cleared", {IntField("entries", static_cast<int64_t>(removed))});
}

} // namespace cardposter::cache
