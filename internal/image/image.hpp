#pragma once

#include <cstdint>
#include <vector>

namespace cardposter::image {

/*
  Decoded raster, always RGBA8, rows packed top to bottom.
*/
struct Image {
  int                  width  = 0;
  int                  height = 0;
  std::vector<uint8_t> pixels;

  bool Empty() const {
    return width <= 0 || height <= 0;
  }
};

struct Color {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  uint8_t a = 255;
};

struct Rect {
  int x = 0;
  int y = 0;
  int w = 0;
  int h = 0;
};

} // namespace cardposter::image
