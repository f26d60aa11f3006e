#include "image_codec.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <mutex>
#include <string>

// stb implementations must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

#include "internal/util/errors.hpp"

namespace cardposter::image {

namespace {

// stbi_write_png_compression_level is a process global
std::mutex png_level_mutex;

void AppendToString(void* context, void* data, int size) {
  auto* out = static_cast<std::string*>(context);
  out->append(static_cast<const char*>(data), static_cast<size_t>(size));
}

void CheckEncodable(const Image& img) {
  if (img.Empty()) {
    throw util::RenderError("cannot encode an empty image");
  }
  const size_t need = static_cast<size_t>(img.width) * static_cast<size_t>(img.height) * 4u;
  if (img.pixels.size() < need) {
    throw util::RenderError("invalid RGBA buffer size");
  }
}

int ToStbLength(size_t size) {
  if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw util::RenderError("image payload too large to decode");
  }
  return static_cast<int>(size);
}

} // namespace

std::optional<ImageInfo> ReadHeader(const uint8_t* data, size_t size) {
  if (!data || size == 0 || size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }

  ImageInfo info;
  if (!stbi_info_from_memory(data, static_cast<int>(size), &info.width, &info.height, &info.channels)) {
    return std::nullopt;
  }
  if (info.width <= 0 || info.height <= 0) {
    return std::nullopt;
  }
  return info;
}

Image Decode(const uint8_t* data, size_t size) {
  if (!data || size == 0) {
    throw util::RenderError("empty image payload");
  }

  int w                = 0;
  int h                = 0;
  int channels_in_file = 0;

  // Force 4 channels so we always get RGBA8.
  unsigned char* decoded = stbi_load_from_memory(data, ToStbLength(size), &w, &h, &channels_in_file, 4);
  if (!decoded) {
    const char* reason = stbi_failure_reason();
    throw util::RenderError(std::string("failed to decode image: ") + (reason ? reason : "unknown error"));
  }

  std::unique_ptr<unsigned char, void (*)(void*)> guard(decoded, stbi_image_free);
  if (w <= 0 || h <= 0) {
    throw util::RenderError("invalid image dimensions");
  }

  Image img;
  img.width  = w;
  img.height = h;
  img.pixels.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 4u);
  std::memcpy(img.pixels.data(), decoded, img.pixels.size());
  return img;
}

std::shared_ptr<arrow::Buffer> EncodePng(const Image& img, int compression_level) {
  CheckEncodable(img);

  std::string out;
  int         ok = 0;
  {
    std::scoped_lock lock(png_level_mutex);
    stbi_write_png_compression_level = std::clamp(compression_level, 0, 9);
    ok = stbi_write_png_to_func(AppendToString, &out, img.width, img.height, 4, img.pixels.data(), img.width * 4);
  }
  if (!ok) {
    throw util::RenderError("stbi_write_png_to_func() failed");
  }
  return arrow::Buffer::FromString(std::move(out));
}

std::shared_ptr<arrow::Buffer> EncodeJpeg(const Image& img, int quality) {
  CheckEncodable(img);

  quality = std::clamp(quality, 1, 100);

  // stb writes JPEG from RGB; drop alpha.
  std::vector<uint8_t> rgb(static_cast<size_t>(img.width) * static_cast<size_t>(img.height) * 3u);
  for (size_t i = 0, j = 0; j < rgb.size(); i += 4, j += 3) {
    rgb[j + 0] = img.pixels[i + 0];
    rgb[j + 1] = img.pixels[i + 1];
    rgb[j + 2] = img.pixels[i + 2];
  }

  std::string out;
  if (!stbi_write_jpg_to_func(AppendToString, &out, img.width, img.height, 3, rgb.data(), quality)) {
    throw util::RenderError("stbi_write_jpg_to_func() failed");
  }
  return arrow::Buffer::FromString(std::move(out));
}

} // namespace cardposter::image
