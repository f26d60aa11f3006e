#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cardposter::util {

/*
  SHA-256 as lowercase hex (64 chars).
*/
std::string Sha256Hex(const uint8_t* data, std::size_t size);

inline std::string Sha256Hex(std::string_view text) {
  return Sha256Hex(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace cardposter::util
