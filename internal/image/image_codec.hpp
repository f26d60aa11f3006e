#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "internal/image/image.hpp"

namespace cardposter::image {

struct ImageInfo {
  int width    = 0;
  int height   = 0;
  int channels = 0;
};

// Header-only check; does not decode pixels. nullopt = not a decodable image.
std::optional<ImageInfo> ReadHeader(const uint8_t* data, size_t size);

// Full decode to RGBA8. Throws util::RenderError.
Image Decode(const uint8_t* data, size_t size);

// level 0..9; stb's deflate treats higher as slower/smaller
std::shared_ptr<arrow::Buffer> EncodePng(const Image& img, int compression_level);

// quality 1..100, alpha dropped
std::shared_ptr<arrow::Buffer> EncodeJpeg(const Image& img, int quality);

} // namespace cardposter::image
