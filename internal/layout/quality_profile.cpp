#include "quality_profile.hpp"

#include "internal/image/bitmap_font.hpp"
#include "internal/util/errors.hpp"

namespace cardposter::layout {

using namespace cardposter::v1;

namespace {

QualityProfile Make(QualityTier tier, int w, int h, int spacing, int font_scale, uint64_t budget, int png_level, int jpeg_quality) {
  QualityProfile p;
  p.tier                  = tier;
  p.card_width            = w;
  p.card_height           = h;
  p.spacing               = spacing;
  p.font_scale            = font_scale;
  p.label_band            = kLabelLines * image::font::LineHeight(font_scale);
  p.page_pixel_budget     = budget;
  p.png_compression_level = png_level;
  p.jpeg_quality          = jpeg_quality;
  return p;
}

} // namespace

QualityProfile ProfileFor(QualityTier tier, const PixelBudgets& budgets) {
  switch (tier) {
    case QUALITY_TIER_HIGH:
      return Make(tier, 245, 342, 20, 2, budgets.high, 1, 95);
    case QUALITY_TIER_MEDIUM:
      return Make(tier, 180, 252, 15, 2, budgets.medium, 3, 85);
    case QUALITY_TIER_LOW:
      return Make(tier, 120, 168, 10, 1, budgets.low, 6, 70);
    default:
      throw util::InvalidConfig("export quality must be one of high, medium, low");
  }
}

} // namespace cardposter::layout
