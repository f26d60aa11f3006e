#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/util/uuid.hpp"

namespace cardposter::storage::common {

inline void ValidateBlobName(const std::string& name) {
  if (name.empty()) {
    throw std::invalid_argument("blob name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("blob name contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument("blob name must not be a relative path component");
  }
}

inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& name) {
  ValidateBlobName(name);
  return root / (name + ".bin");
}

// Sibling of `destination`, unique per call; renamed over it once complete.
inline std::filesystem::path TempPathFor(const std::filesystem::path& destination) {
  return destination.string() + "." + util::ToString(util::GenerateUUID()) + ".tmp";
}

} // namespace cardposter::storage::common
