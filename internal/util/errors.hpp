#pragma once

#include <stdexcept>
#include <string>

namespace cardposter::util {

/*
  Central error types.

  Per-card download problems never surface as exceptions; they become
  placeholders. These are for failures a caller has to react to.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::invalid_argument {
 public:
  explicit InvalidConfig(const std::string& msg) : std::invalid_argument(msg) {
  }
};

/*
  Durable storage (cache index, cache blobs, page artifacts) failed.
*/
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CacheWriteError : public StorageError {
 public:
  explicit CacheWriteError(const std::string& msg) : StorageError(msg) {
  }
};

class CacheFull : public StorageError {
 public:
  explicit CacheFull(const std::string& msg) : StorageError(msg) {
  }
};

class RenderError : public std::runtime_error {
 public:
  explicit RenderError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace cardposter::util
