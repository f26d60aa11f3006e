#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "cardposter/v1.hpp"
#include "internal/image/image.hpp"
#include "internal/layout/quality_profile.hpp"

namespace cardposter::layout {

struct CellPlacement {
  cardposter::v1::CardRef card;
  uint32_t                row    = 0;
  uint32_t                column = 0;
};

/*
  One output page. cells are in row-major order; every filtered card is
  in exactly one cell of exactly one page.
*/
struct PagePlan {
  uint32_t                   page_index = 0;
  uint32_t                   page_count = 0;
  uint32_t                   columns    = 0;
  uint32_t                   rows       = 0;
  std::vector<CellPlacement> cells;
};

struct PageGeometry {
  int width  = 0;
  int height = 0;

  image::Rect header;
  image::Rect footer;

  int cell_width  = 0;
  int cell_height = 0;
  int spacing     = 0;
  int card_width  = 0;
  int card_height = 0;
  int label_band  = 0;
};

struct PageDimensions {
  int width  = 0;
  int height = 0;
};

struct SizeEstimate {
  uint32_t                    card_count = 0;
  uint32_t                    pages      = 0;
  uint32_t                    cells_per_page = 0;
  std::vector<PageDimensions> page_dimensions;
  // uncompressed RGBA, all pages
  double                   raw_megabytes = 0;
  std::vector<std::string> warnings;
};

/*
  Stateless layout rules. Pure functions of their inputs: the same cards
  and config always give the same pages, cells and pixel geometry.
*/
class LayoutEngine {
 public:
  // Keeps cards in the generation filter (empty = all), stable-sorted by
  // (generation, dex number, name).
  static std::vector<cardposter::v1::CardRef> FilterAndSort(const std::vector<cardposter::v1::CardRef>& cards,
                                                            const cardposter::v1::ExportConfig& config);

  // Throws util::InvalidConfig with the first problem found, including a
  // page pixel budget that cannot hold one full row of cards.
  static void Validate(const cardposter::v1::ExportConfig& config, const PixelBudgets& budgets, uint32_t max_cards,
                       size_t card_count);

  // cards_per_row * max(1, floor(floor(budget / cell_px) / cards_per_row)).
  // Never above budget / cell_px for a configuration Validate accepts.
  static uint32_t CellsPerPage(const QualityProfile& profile, uint32_t cards_per_row);

  // cards must already be filtered and sorted. Empty input → empty plan.
  static std::vector<PagePlan> Plan(const std::vector<cardposter::v1::CardRef>& cards, const cardposter::v1::ExportConfig& config,
                                    const QualityProfile& profile);

  static PageGeometry GeometryFor(const PagePlan& page, const QualityProfile& profile);

  // Card image box of a cell.
  static image::Rect CellRect(const PageGeometry& geometry, uint32_t row, uint32_t column);

  // Reserved label band under the card box.
  static image::Rect LabelRect(const PageGeometry& geometry, uint32_t row, uint32_t column);

  static SizeEstimate Estimate(const std::vector<cardposter::v1::CardRef>& cards, const cardposter::v1::ExportConfig& config,
                               const QualityProfile& profile);

  // Artifact name prefix: file_stem, else sanitized title (+ _gen<a>-<b>), else "collection".
  static std::string ArtifactStem(const cardposter::v1::ExportConfig& config);
};

} // namespace cardposter::layout
