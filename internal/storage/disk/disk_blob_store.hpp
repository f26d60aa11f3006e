#pragma once

#include <filesystem>

#include "internal/storage/blob_store.hpp"

namespace cardposter::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - atomic replace writes (unique temp name per writer)
    - optional fsync
    - one file per blob: <root>/<name>.bin
*/

class DiskBlobStore final : public BlobStore {
 public:
  explicit DiskBlobStore(std::filesystem::path root);

  std::shared_ptr<arrow::Buffer> Read(const std::string& name) override;

  void Write(const std::string& name, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  void Remove(const std::string& name) override;

  bool Exists(const std::string& name) override;

  void RemoveAll() override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace cardposter::storage
