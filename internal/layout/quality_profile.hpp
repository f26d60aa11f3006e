#pragma once

#include <cstdint>

#include "cardposter/v1.hpp"

namespace cardposter::layout {

inline constexpr int kLabelLines   = 3;
inline constexpr int kHeaderHeight = 80;
inline constexpr int kFooterHeight = 60;

/*
  Pixel geometry and encoder settings of one quality tier.
*/
struct QualityProfile {
  cardposter::v1::QualityTier tier = cardposter::v1::QUALITY_TIER_UNSPECIFIED;

  int card_width  = 0;
  int card_height = 0;
  int spacing     = 0;
  int font_scale  = 1;
  // kLabelLines of text, reserved whether or not labels are drawn
  int label_band = 0;

  uint64_t page_pixel_budget = 0;

  int png_compression_level = 6;
  int jpeg_quality          = 85;

  int CellWidth() const {
    return card_width + spacing;
  }
  int CellHeight() const {
    return card_height + label_band + spacing;
  }
  uint64_t CellPixels() const {
    return static_cast<uint64_t>(CellWidth()) * static_cast<uint64_t>(CellHeight());
  }
};

struct PixelBudgets {
  uint64_t high   = 6'000'000;
  uint64_t medium = 4'000'000;
  uint64_t low    = 2'000'000;
};

// Throws util::InvalidConfig for QUALITY_TIER_UNSPECIFIED.
QualityProfile ProfileFor(cardposter::v1::QualityTier tier, const PixelBudgets& budgets = {});

} // namespace cardposter::layout
