#include "ram_blob_store.hpp"

#include <mutex>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace cardposter::storage {

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamBlobStore::Read(const std::string& name) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(name);
  if (it == buffers_.end()) throw util::NotFound("blob not found: " + name);

  return it->second;
}

void RamBlobStore::Write(const std::string& name, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  common::ValidateBlobName(name);
  std::unique_lock lock(mutex_);
  buffers_[name] = buffer;
}

void RamBlobStore::Remove(const std::string& name) {
  std::unique_lock lock(mutex_);
  buffers_.erase(name);
}

bool RamBlobStore::Exists(const std::string& name) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(name);
}

void RamBlobStore::RemoveAll() {
  std::unique_lock lock(mutex_);
  buffers_.clear();
}

size_t RamBlobStore::Count() const {
  std::shared_lock lock(mutex_);
  return buffers_.size();
}

} // namespace cardposter::storage
