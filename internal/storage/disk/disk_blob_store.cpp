#include "disk_blob_store.hpp"

#include <arrow/io/file.h>

#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace cardposter::storage {

using namespace cardposter::storage::common;

DiskBlobStore::DiskBlobStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::shared_ptr<arrow::Buffer> DiskBlobStore::Read(const std::string& name) {
  auto path = BlobPath(root_, name);
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("blob not found: " + name);
  }

  try {
    auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
    return ReadAll(file);
  } catch (const std::runtime_error& e) {
    throw util::StorageError("read blob " + name + ": " + e.what());
  }
}

void DiskBlobStore::Write(const std::string& name, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  auto final_path = BlobPath(root_, name);

  try {
    WriteFileAtomic(final_path, buffer, fsync);
  } catch (const std::exception& e) {
    throw util::CacheWriteError("write blob " + name + ": " + e.what());
  }
}

void DiskBlobStore::Remove(const std::string& name) {
  std::error_code ec;
  std::filesystem::remove(BlobPath(root_, name), ec);
  if (ec) {
    throw util::StorageError("remove blob " + name + ": " + ec.message());
  }
}

bool DiskBlobStore::Exists(const std::string& name) {
  std::error_code ec;
  return std::filesystem::exists(BlobPath(root_, name), ec);
}

void DiskBlobStore::RemoveAll() {
  std::error_code ec;
  for (const auto& item : std::filesystem::directory_iterator(root_, ec)) {
    if (!item.is_regular_file()) continue;
    std::filesystem::remove(item.path(), ec);
    if (ec) {
      throw util::StorageError("remove blob " + item.path().string() + ": " + ec.message());
    }
  }
  if (ec) {
    throw util::StorageError("list blobs in " + root_.string() + ": " + ec.message());
  }
}

} // namespace cardposter::storage
