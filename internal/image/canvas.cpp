#include "canvas.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "internal/image/bitmap_font.hpp"
#include "internal/util/errors.hpp"

namespace cardposter::image {

Canvas::Canvas(int width, int height, Color background) {
  if (width <= 0 || height <= 0) {
    throw util::RenderError("canvas dimensions must be positive");
  }
  img_.width  = width;
  img_.height = height;
  img_.pixels.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 4u);
  FillRect({0, 0, width, height}, background);
}

void Canvas::Put(int x, int y, Color c) {
  if (x < 0 || y < 0 || x >= img_.width || y >= img_.height) return;
  auto* p = &img_.pixels[(static_cast<size_t>(y) * static_cast<size_t>(img_.width) + static_cast<size_t>(x)) * 4u];
  p[0]    = c.r;
  p[1]    = c.g;
  p[2]    = c.b;
  p[3]    = c.a;
}

Color Canvas::PixelAt(int x, int y) const {
  if (x < 0 || y < 0 || x >= img_.width || y >= img_.height) return {};
  const auto* p = &img_.pixels[(static_cast<size_t>(y) * static_cast<size_t>(img_.width) + static_cast<size_t>(x)) * 4u];
  return {p[0], p[1], p[2], p[3]};
}

void Canvas::FillRect(const Rect& r, Color c) {
  const int x0 = std::max(r.x, 0);
  const int y0 = std::max(r.y, 0);
  const int x1 = std::min(r.x + r.w, img_.width);
  const int y1 = std::min(r.y + r.h, img_.height);
  for (int y = y0; y < y1; ++y) {
    for (int x = x0; x < x1; ++x) {
      Put(x, y, c);
    }
  }
}

void Canvas::StrokeRect(const Rect& r, int thickness, Color c) {
  FillRect({r.x, r.y, r.w, thickness}, c);
  FillRect({r.x, r.y + r.h - thickness, r.w, thickness}, c);
  FillRect({r.x, r.y, thickness, r.h}, c);
  FillRect({r.x + r.w - thickness, r.y, thickness, r.h}, c);
}

Rect Canvas::DrawImageFit(const Image& src, const Rect& box) {
  if (src.Empty() || box.w <= 0 || box.h <= 0) return {box.x, box.y, 0, 0};

  const double scale = std::min(static_cast<double>(box.w) / src.width, static_cast<double>(box.h) / src.height);
  const int    dw    = std::max(1, static_cast<int>(std::lround(src.width * scale)));
  const int    dh    = std::max(1, static_cast<int>(std::lround(src.height * scale)));
  const Rect   dst{box.x + (box.w - dw) / 2, box.y + (box.h - dh) / 2, dw, dh};

  const double sx = static_cast<double>(src.width) / dw;
  const double sy = static_cast<double>(src.height) / dh;

  auto sample = [&src](int x, int y, int ch) -> double {
    x = std::clamp(x, 0, src.width - 1);
    y = std::clamp(y, 0, src.height - 1);
    return src.pixels[(static_cast<size_t>(y) * static_cast<size_t>(src.width) + static_cast<size_t>(x)) * 4u + ch];
  };

  for (int y = 0; y < dh; ++y) {
    // pixel centers
    const double fy = std::max(0.0, (y + 0.5) * sy - 0.5);
    const int    y0 = static_cast<int>(fy);
    const double ty = fy - y0;
    for (int x = 0; x < dw; ++x) {
      const double fx = std::max(0.0, (x + 0.5) * sx - 0.5);
      const int    x0 = static_cast<int>(fx);
      const double tx = fx - x0;

      uint8_t out[4];
      for (int ch = 0; ch < 4; ++ch) {
        const double top    = sample(x0, y0, ch) * (1 - tx) + sample(x0 + 1, y0, ch) * tx;
        const double bottom = sample(x0, y0 + 1, ch) * (1 - tx) + sample(x0 + 1, y0 + 1, ch) * tx;
        out[ch]             = static_cast<uint8_t>(std::clamp(std::lround(top * (1 - ty) + bottom * ty), 0L, 255L));
      }
      // alpha dropped, cards are opaque on the page
      Put(dst.x + x, dst.y + y, {out[0], out[1], out[2], 255});
    }
  }
  return dst;
}

void Canvas::DrawText(int x, int y, std::string_view text, int scale, Color c) {
  scale = std::max(scale, 1);
  int         pen = x;
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    pos += font::DecodeNext(text, pos, cp);
    const auto& glyph = font::Glyph(font::Fold(cp));
    for (int row = 0; row < font::kGlyphHeight; ++row) {
      for (int col = 0; col < font::kGlyphWidth; ++col) {
        if (glyph[row] & (0x10 >> col)) {
          FillRect({pen + col * scale, y + row * scale, scale, scale}, c);
        }
      }
    }
    pen += font::kAdvance * scale;
  }
}

std::string_view FitText(std::string_view text, int max_width, int scale, std::string& storage) {
  if (font::TextWidth(text, scale) <= max_width) return text;

  const int per_char = font::kAdvance * std::max(scale, 1);
  const int capacity = (max_width + std::max(scale, 1)) / per_char;
  // cut on codepoint boundaries, never inside a multi-byte character
  if (capacity <= 2) {
    storage.assign(text.substr(0, font::PrefixBytes(text, static_cast<size_t>(std::max(capacity, 0)))));
    return storage;
  }
  storage.assign(text.substr(0, font::PrefixBytes(text, static_cast<size_t>(capacity - 2))));
  storage += "..";
  return storage;
}

} // namespace cardposter::image
