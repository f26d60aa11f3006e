#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace cardposter::util {

// Random (version 4) UUID. Names temp files so two workers writing the same
// blob or page never share a temp path.
using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// 8-4-4-4-12 lowercase hex
std::string ToString(const UUID& id);

} // namespace cardposter::util
