#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cardposter::image::font {

// Embedded 1bpp 5x7 font, ASCII 32..95. Lowercase renders as uppercase;
// anything else outside the table renders as '?'.
inline constexpr int kGlyphWidth  = 5;
inline constexpr int kGlyphHeight = 7;
inline constexpr int kAdvance     = kGlyphWidth + 1;
inline constexpr int kLineHeight  = kGlyphHeight + 3;

inline constexpr char32_t kReplacement = 0xFFFD;

// One byte per row, bit 4 = leftmost column.
const std::array<uint8_t, kGlyphHeight>& Glyph(char c);

// Decodes the UTF-8 sequence at text[pos] into cp and returns its length in
// bytes (at least 1). Malformed or truncated sequences yield kReplacement for
// a single byte.
std::size_t DecodeNext(std::string_view text, std::size_t pos, char32_t& cp);

// Character drawn for a codepoint: ASCII as is, Latin-1 letters folded to
// their base letter ("é" -> 'e'), typographic quotes to ASCII, else '?'.
char Fold(char32_t cp);

// Number of glyphs text draws, one per codepoint.
std::size_t GlyphCount(std::string_view text);

// Byte length of the first `glyphs` codepoints of text.
std::size_t PrefixBytes(std::string_view text, std::size_t glyphs);

inline int TextWidth(std::string_view text, int scale) {
  const auto glyphs = GlyphCount(text);
  if (glyphs == 0) return 0;
  return (static_cast<int>(glyphs) * kAdvance - 1) * scale;
}

inline int LineHeight(int scale) {
  return kLineHeight * scale;
}

} // namespace cardposter::image::font
