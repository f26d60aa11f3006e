#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "cardposter/v1.hpp"
#include "internal/download/downloader.hpp"
#include "internal/image/image.hpp"
#include "internal/layout/layout_engine.hpp"
#include "internal/util/time.hpp"

namespace cardposter::render {

struct RenderOptions {
  std::string attribution = "Exported by Card Poster";
  bool        fsync       = true;
};

struct EncodedPage {
  uint32_t                       page_index = 0;
  int                            width      = 0;
  int                            height     = 0;
  std::shared_ptr<arrow::Buffer> bytes;
  // cells whose bytes failed to decode and were drawn as placeholders
  uint32_t decode_fallbacks = 0;
};

/*
  Paints one planned page and encodes it.

  images[i] belongs to page.cells[i]. Painting goes by planned cell, so
  the output depends only on the plan and the images, never on the order
  in which cards were resolved.
*/
class Compositor {
 public:
  explicit Compositor(RenderOptions options = {});

  // Throws util::RenderError on a plan/image mismatch or encoder failure.
  EncodedPage Render(const layout::PagePlan& page, const std::vector<download::ResolvedImage>& images,
                     const cardposter::v1::ExportConfig& config, const layout::QualityProfile& profile, util::TimePoint export_time) const;

  // Raw canvas, before encoding.
  image::Image Paint(const layout::PagePlan& page, const std::vector<download::ResolvedImage>& images,
                     const cardposter::v1::ExportConfig& config, const layout::QualityProfile& profile, util::TimePoint export_time,
                     uint32_t* decode_fallbacks = nullptr) const;

  // Atomic write, parent directories created. Throws util::StorageError.
  std::filesystem::path WritePage(const EncodedPage& page, const std::filesystem::path& destination) const;

  // <stem>_p<NNN>.<png|jpg>, NNN is the 1-based page number
  static std::string PageFileName(const std::string& stem, uint32_t page_index, cardposter::v1::OutputFormat format);

  // Label lines for one card, in drawing order.
  static std::vector<std::string> LabelLines(const cardposter::v1::CardRef& card, const cardposter::v1::ExportConfig& config);

 private:
  RenderOptions options_;
};

} // namespace cardposter::render
