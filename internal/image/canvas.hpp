#pragma once

#include <string_view>

#include "internal/image/image.hpp"

namespace cardposter::image {

/*
  RGBA8 drawing surface.

  All primitives clip to the canvas; nothing blends, every write is opaque
  over the previous pixel.
*/
class Canvas {
 public:
  Canvas(int width, int height, Color background);

  int Width() const {
    return img_.width;
  }
  int Height() const {
    return img_.height;
  }

  void FillRect(const Rect& r, Color c);
  void StrokeRect(const Rect& r, int thickness, Color c);

  // Scales src to fit inside box, aspect preserved, centered, bilinear.
  // Returns the rectangle actually covered.
  Rect DrawImageFit(const Image& src, const Rect& box);

  // Single line, top-left anchored, bitmap font at integer scale.
  void DrawText(int x, int y, std::string_view text, int scale, Color c);

  Color PixelAt(int x, int y) const;

  const Image& View() const {
    return img_;
  }
  Image Release() {
    return std::move(img_);
  }

 private:
  void Put(int x, int y, Color c);

  Image img_;
};

// Longest prefix of text that fits max_width at scale; ends with ".." when cut.
std::string_view FitText(std::string_view text, int max_width, int scale, std::string& storage);

} // namespace cardposter::image
