#include "compositor.hpp"

#include <algorithm>
#include <cstdio>
#include <set>

#include "internal/image/bitmap_font.hpp"
#include "internal/image/canvas.hpp"
#include "internal/image/image_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace cardposter::render {

using namespace cardposter::v1;
using image::Canvas;
using image::Color;
using image::Rect;
using observability::StringField;

namespace {

constexpr Color kBackground{245, 245, 245};
constexpr Color kHeaderFill{44, 62, 80};
constexpr Color kHeaderText{255, 255, 255};
constexpr Color kFooterFill{236, 240, 241};
constexpr Color kFooterText{52, 73, 94};
constexpr Color kCardBox{255, 255, 255};
constexpr Color kLabelText{33, 33, 33};
constexpr Color kPlaceholderFill{220, 220, 220};
constexpr Color kPlaceholderBorder{150, 150, 150};
constexpr Color kPlaceholderText{90, 90, 90};

constexpr int kPlaceholderBorderWidth = 2;

void DrawFitted(Canvas& canvas, int x, int y, int max_width, const std::string& text, int scale, Color color) {
  std::string storage;
  canvas.DrawText(x, y, image::FitText(text, max_width, scale, storage), scale, color);
}

void DrawCentered(Canvas& canvas, const Rect& box, int y, const std::string& text, int scale, Color color) {
  std::string storage;
  const auto  fitted = image::FitText(text, box.w - 2 * scale, scale, storage);
  const int   width  = image::font::TextWidth(fitted, scale);
  canvas.DrawText(box.x + (box.w - width) / 2, y, fitted, scale, color);
}

void DrawPlaceholder(Canvas& canvas, const Rect& box, const CardRef& card, int scale) {
  canvas.FillRect(box, kPlaceholderFill);
  canvas.StrokeRect(box, kPlaceholderBorderWidth, kPlaceholderBorder);

  const int line = image::font::LineHeight(scale);
  const int mid  = box.y + box.h / 2;
  DrawCentered(canvas, box, mid - line, "NO IMAGE", scale, kPlaceholderText);
  DrawCentered(canvas, box, mid + line / 2, card.name(), scale, kPlaceholderText);
}

} // namespace

Compositor::Compositor(RenderOptions options) : options_(std::move(options)) {
}

std::vector<std::string> Compositor::LabelLines(const CardRef& card, const ExportConfig& config) {
  const std::set<int> labels(config.labels().begin(), config.labels().end());

  std::vector<std::string> lines;
  if (labels.contains(LABEL_FIELD_DEX_NUMBER)) {
    char dex[16];
    std::snprintf(dex, sizeof(dex), "#%03u ", card.dex_number());
    lines.push_back((card.dex_number() > 0 ? std::string(dex) : std::string()) + card.name());
  }
  if (labels.contains(LABEL_FIELD_SET_NAME) && !card.set_name().empty()) {
    lines.push_back(card.set_name());
  }
  if (labels.contains(LABEL_FIELD_ARTIST) && !card.artist().empty()) {
    lines.push_back("Illus. " + card.artist());
  }
  return lines;
}

image::Image Compositor::Paint(const layout::PagePlan& page, const std::vector<download::ResolvedImage>& images, const ExportConfig& config,
                               const layout::QualityProfile& profile, util::TimePoint export_time, uint32_t* decode_fallbacks) const {
  if (images.size() != page.cells.size()) {
    throw util::RenderError("page " + std::to_string(page.page_index) + ": " + std::to_string(images.size()) + " images for " +
                            std::to_string(page.cells.size()) + " cells");
  }

  const auto geometry = layout::LayoutEngine::GeometryFor(page, profile);
  const int  scale    = profile.font_scale;
  Canvas     canvas(geometry.width, geometry.height, kBackground);

  // header: title, and page number when there is more than one page
  canvas.FillRect(geometry.header, kHeaderFill);
  const int   title_scale = scale + 1;
  const int   title_y     = (geometry.header.h - image::font::kGlyphHeight * title_scale) / 2;
  std::string page_label;
  if (page.page_count > 1) {
    page_label = "PAGE " + std::to_string(page.page_index + 1) + "/" + std::to_string(page.page_count);
  }
  const int page_label_width = image::font::TextWidth(page_label, scale);
  const int title_room       = geometry.width - 2 * geometry.spacing - (page_label.empty() ? 0 : page_label_width + geometry.spacing);
  DrawFitted(canvas, geometry.spacing, title_y, title_room, config.title().empty() ? "Card Collection" : config.title(), title_scale,
             kHeaderText);
  if (!page_label.empty()) {
    canvas.DrawText(geometry.width - geometry.spacing - page_label_width, (geometry.header.h - image::font::kGlyphHeight * scale) / 2,
                    page_label, scale, kHeaderText);
  }

  uint32_t fallbacks = 0;
  for (size_t i = 0; i < page.cells.size(); ++i) {
    const auto& cell     = page.cells[i];
    const auto& resolved = images[i];
    const auto  box      = layout::LayoutEngine::CellRect(geometry, cell.row, cell.column);

    bool drawn = false;
    if (resolved.origin != IMAGE_ORIGIN_PLACEHOLDER && resolved.bytes) {
      try {
        const auto decoded = image::Decode(resolved.bytes->data(), static_cast<size_t>(resolved.bytes->size()));
        canvas.FillRect(box, kCardBox);
        canvas.DrawImageFit(decoded, box);
        drawn = true;
      } catch (const util::RenderError& e) {
        fallbacks++;
        CARDPOSTER_LOG_WARN("card image failed to decode, drawing placeholder",
                            {StringField("card_id", cell.card.id()), StringField("error", e.what())});
      }
    }
    if (!drawn) {
      DrawPlaceholder(canvas, box, cell.card, scale);
    }

    const auto label = layout::LayoutEngine::LabelRect(geometry, cell.row, cell.column);
    const int  line  = image::font::LineHeight(scale);
    int        y     = label.y + (line - image::font::kGlyphHeight * scale) / 2;
    for (const auto& text : LabelLines(cell.card, config)) {
      DrawFitted(canvas, label.x, y, label.w, text, scale, kLabelText);
      y += line;
    }
  }

  // footer: export date and attribution
  canvas.FillRect(geometry.footer, kFooterFill);
  const int footer_line = image::font::LineHeight(scale);
  const int footer_y    = geometry.footer.y + (geometry.footer.h - 2 * footer_line) / 2;
  const int footer_room = geometry.width - 2 * geometry.spacing;
  DrawFitted(canvas, geometry.spacing, footer_y, footer_room, "Exported on " + util::FormatLocal(export_time, "%B %d, %Y %H:%M"), scale,
             kFooterText);
  DrawFitted(canvas, geometry.spacing, footer_y + footer_line, footer_room, options_.attribution, scale, kFooterText);

  if (decode_fallbacks) *decode_fallbacks = fallbacks;
  return canvas.Release();
}

EncodedPage Compositor::Render(const layout::PagePlan& page, const std::vector<download::ResolvedImage>& images, const ExportConfig& config,
                               const layout::QualityProfile& profile, util::TimePoint export_time) const {
  EncodedPage out;
  out.page_index = page.page_index;

  auto painted = Paint(page, images, config, profile, export_time, &out.decode_fallbacks);
  out.width    = painted.width;
  out.height   = painted.height;

  if (config.format() == OUTPUT_FORMAT_JPEG) {
    out.bytes = image::EncodeJpeg(painted, profile.jpeg_quality);
  } else {
    out.bytes = image::EncodePng(painted, profile.png_compression_level);
  }
  return out;
}

std::filesystem::path Compositor::WritePage(const EncodedPage& page, const std::filesystem::path& destination) const {
  if (!page.bytes) {
    throw util::RenderError("page " + std::to_string(page.page_index) + " has not been encoded");
  }

  try {
    if (destination.has_parent_path()) {
      std::filesystem::create_directories(destination.parent_path());
    }
    storage::common::WriteFileAtomic(destination, page.bytes, options_.fsync);
  } catch (const std::exception& e) {
    throw util::StorageError("write page " + destination.string() + ": " + e.what());
  }

  CARDPOSTER_LOG_INFO("page written", {StringField("path", destination.string()),
                                       observability::IntField("bytes", static_cast<int64_t>(page.bytes->size()))});
  return destination;
}

std::string Compositor::PageFileName(const std::string& stem, uint32_t page_index, OutputFormat format) {
  char number[16];
  std::snprintf(number, sizeof(number), "_p%03u", page_index + 1);
  return stem + number + (format == OUTPUT_FORMAT_JPEG ? ".jpg" : ".png");
}

} // namespace cardposter::render
