#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

namespace cardposter::storage {

/*
  Blob storage abstraction for cached image bytes.

  Every blob is an Arrow Buffer addressed by a flat name. The cache index
  decides which name is current; a blob store has no notion of versions.

  Implementations:
    DISK → Arrow file IO, atomic writes
    RAM  → in-memory Arrow buffers (tests, memory-only caches)

  Errors:
    Read of a missing blob → util::NotFound
    other read failures    → util::StorageError
    write failures         → util::CacheWriteError
*/

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& name) = 0;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Persist a buffer under name. Readers see either nothing or the
    complete buffer, never a partial write.
  */
  virtual void Write(const std::string& name, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  // ------------------------------------------------------------------
  // Remove
  // ------------------------------------------------------------------
  // Removing a missing blob is not an error.
  virtual void Remove(const std::string& name) = 0;

  virtual bool Exists(const std::string& name) = 0;

  // Drops every blob, including ones no index row references.
  virtual void RemoveAll() = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace cardposter::storage
