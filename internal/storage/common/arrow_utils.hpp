#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace cardposter::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

/*
  Atomic write:
      write unique tmp → flush → rename

  The temp file lives next to the destination so the rename never crosses
  filesystems. On failure the temp file is removed and the error rethrown;
  the destination holds either the old file or the complete new one.
*/
void WriteFileAtomic(const std::filesystem::path& destination, const uint8_t* data, int64_t size, bool fsync);

inline void WriteFileAtomic(const std::filesystem::path& destination, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  WriteFileAtomic(destination, buffer->data(), buffer->size(), fsync);
}

} // namespace cardposter::storage::common
