#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "internal/storage/blob_store.hpp"

namespace cardposter::storage {

/*
  RAM blob store.

  Backed by Arrow buffers stored in-memory.
  Provides zero-copy reads to callers.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamBlobStore final : public BlobStore {
 public:
  RamBlobStore()           = default;
  ~RamBlobStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& name) override;

  void Write(const std::string& name, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  void Remove(const std::string& name) override;

  bool Exists(const std::string& name) override;

  void RemoveAll() override;

  size_t Count() const;

 private:
  mutable std::shared_mutex                                      mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace cardposter::storage
