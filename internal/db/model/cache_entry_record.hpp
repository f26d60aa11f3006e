#pragma once

#include <cstdint>
#include <string>

namespace cardposter::db::model {

enum class CacheStatus : int {
  kActive  = 0,
  kStale   = 1,
  kEvicted = 2,
};

/*
  Persistent cache row, one per cache key.

  - blob_ref names the blob holding the bytes of the current version.
  - content changes never rewrite a blob; a new version gets a new blob_ref.
  - version starts at 1 and increments whenever the content hash changes.
*/
struct CacheEntryRecord {
  std::string key;
  std::string source_url;
  std::string blob_ref;
  std::string content_hash;

  uint64_t size_bytes       = 0;
  uint64_t fetched_at_ms    = 0;
  uint64_t last_accessed_ms = 0;
  uint64_t access_count     = 0;
  uint64_t version          = 0;

  CacheStatus status = CacheStatus::kActive;
};

inline const char* CacheStatusName(CacheStatus status) {
  switch (status) {
    case CacheStatus::kActive:
      return "active";
    case CacheStatus::kStale:
      return "stale";
    case CacheStatus::kEvicted:
      return "evicted";
  }
  return "unknown";
}

}
