#include "layout_engine.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>

#include "internal/util/errors.hpp"

namespace cardposter::layout {

using namespace cardposter::v1;

namespace {

constexpr uint32_t kMinCardsPerRow = 2;
constexpr uint32_t kMaxCardsPerRow = 5;

constexpr int      kLargeDimension      = 10000;
constexpr double   kLargePageMegabytes  = 100.0;
constexpr uint32_t kLargeCollectionSize = 500;

uint32_t CeilDiv(uint32_t a, uint32_t b) {
  return (a + b - 1) / b;
}

} // namespace

std::vector<CardRef> LayoutEngine::FilterAndSort(const std::vector<CardRef>& cards, const ExportConfig& config) {
  const std::set<uint32_t> generations(config.generations().begin(), config.generations().end());

  std::vector<CardRef> out;
  out.reserve(cards.size());
  for (const auto& card : cards) {
    if (generations.empty() || generations.contains(card.generation())) {
      out.push_back(card);
    }
  }

  std::stable_sort(out.begin(), out.end(), [](const CardRef& a, const CardRef& b) {
    if (a.generation() != b.generation()) return a.generation() < b.generation();
    if (a.dex_number() != b.dex_number()) return a.dex_number() < b.dex_number();
    return a.name() < b.name();
  });
  return out;
}

void LayoutEngine::Validate(const ExportConfig& config, const PixelBudgets& budgets, uint32_t max_cards, size_t card_count) {
  if (config.cards_per_row() < kMinCardsPerRow || config.cards_per_row() > kMaxCardsPerRow) {
    throw util::InvalidConfig("cards_per_row must be between " + std::to_string(kMinCardsPerRow) + " and " +
                              std::to_string(kMaxCardsPerRow) + ", got " + std::to_string(config.cards_per_row()));
  }
  if (config.quality() == QUALITY_TIER_UNSPECIFIED) {
    throw util::InvalidConfig("quality must be specified (high, medium or low)");
  }
  if (config.output_dir().empty()) {
    throw util::InvalidConfig("output_dir must not be empty");
  }
  const auto     profile = ProfileFor(config.quality(), budgets);
  const uint64_t fit     = profile.page_pixel_budget / profile.CellPixels();
  if (fit < config.cards_per_row()) {
    throw util::InvalidConfig("page pixel budget of " + std::to_string(profile.page_pixel_budget) + " for " +
                              QualityTier_Name(config.quality()) + " fits " + std::to_string(fit) + " card(s), fewer than one row of " +
                              std::to_string(config.cards_per_row()));
  }
  if (max_cards > 0 && card_count > max_cards) {
    throw util::InvalidConfig("collection of " + std::to_string(card_count) + " cards exceeds the limit of " + std::to_string(max_cards));
  }
}

uint32_t LayoutEngine::CellsPerPage(const QualityProfile& profile, uint32_t cards_per_row) {
  cards_per_row       = std::max<uint32_t>(cards_per_row, 1);
  const uint64_t fit  = profile.CellPixels() > 0 ? profile.page_pixel_budget / profile.CellPixels() : 0;
  const uint64_t rows = std::max<uint64_t>(1, fit / cards_per_row);
  return static_cast<uint32_t>(rows * cards_per_row);
}

std::vector<PagePlan> LayoutEngine::Plan(const std::vector<CardRef>& cards, const ExportConfig& config, const QualityProfile& profile) {
  std::vector<PagePlan> pages;
  if (cards.empty()) return pages;

  const uint32_t columns  = std::max<uint32_t>(config.cards_per_row(), 1);
  const uint32_t per_page = CellsPerPage(profile, columns);
  const auto     total    = static_cast<uint32_t>(cards.size());
  const uint32_t count    = CeilDiv(total, per_page);

  pages.reserve(count);
  for (uint32_t p = 0; p < count; ++p) {
    const uint32_t first = p * per_page;
    const uint32_t n     = std::min(per_page, total - first);

    PagePlan page;
    page.page_index = p;
    page.page_count = count;
    page.columns    = columns;
    page.rows       = CeilDiv(n, columns);
    page.cells.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
      page.cells.push_back({cards[first + i], i / columns, i % columns});
    }
    pages.push_back(std::move(page));
  }
  return pages;
}

PageGeometry LayoutEngine::GeometryFor(const PagePlan& page, const QualityProfile& profile) {
  PageGeometry g;
  g.cell_width  = profile.CellWidth();
  g.cell_height = profile.CellHeight();
  g.spacing     = profile.spacing;
  g.card_width  = profile.card_width;
  g.card_height = profile.card_height;
  g.label_band  = profile.label_band;

  g.width  = static_cast<int>(page.columns) * g.cell_width + g.spacing;
  g.height = kHeaderHeight + static_cast<int>(page.rows) * g.cell_height + g.spacing + kFooterHeight;

  g.header = {0, 0, g.width, kHeaderHeight};
  g.footer = {0, g.height - kFooterHeight, g.width, kFooterHeight};
  return g;
}

image::Rect LayoutEngine::CellRect(const PageGeometry& g, uint32_t row, uint32_t column) {
  return {g.spacing + static_cast<int>(column) * g.cell_width, kHeaderHeight + g.spacing + static_cast<int>(row) * g.cell_height,
          g.card_width, g.card_height};
}

image::Rect LayoutEngine::LabelRect(const PageGeometry& g, uint32_t row, uint32_t column) {
  const auto card = CellRect(g, row, column);
  return {card.x, card.y + card.h, card.w, g.label_band};
}

SizeEstimate LayoutEngine::Estimate(const std::vector<CardRef>& cards, const ExportConfig& config, const QualityProfile& profile) {
  SizeEstimate est;

  const auto filtered = FilterAndSort(cards, config);
  est.card_count      = static_cast<uint32_t>(filtered.size());
  est.cells_per_page  = CellsPerPage(profile, std::max<uint32_t>(config.cards_per_row(), 1));
  if (filtered.empty()) {
    est.warnings.push_back("no cards in collection");
    return est;
  }

  const auto pages = Plan(filtered, config, profile);
  est.pages        = static_cast<uint32_t>(pages.size());

  bool   large_dimensions = false;
  double largest_page_mb  = 0;
  for (const auto& page : pages) {
    const auto   g  = GeometryFor(page, profile);
    const double mb = static_cast<double>(g.width) * g.height * 4.0 / (1024.0 * 1024.0);
    est.page_dimensions.push_back({g.width, g.height});
    est.raw_megabytes += mb;
    largest_page_mb  = std::max(largest_page_mb, mb);
    large_dimensions = large_dimensions || g.width > kLargeDimension || g.height > kLargeDimension;
  }

  if (large_dimensions) {
    est.warnings.push_back("very large page dimensions, may cause memory issues");
  }
  if (largest_page_mb > kLargePageMegabytes) {
    std::ostringstream msg;
    msg << "large page size estimated: " << std::fixed << std::setprecision(1) << largest_page_mb << "MB";
    est.warnings.push_back(msg.str());
  }
  if (est.card_count > kLargeCollectionSize) {
    est.warnings.push_back("large collection, export may take several minutes");
  }
  return est;
}

std::string LayoutEngine::ArtifactStem(const ExportConfig& config) {
  if (!config.file_stem().empty()) return config.file_stem();

  std::string stem;
  for (char c : config.title()) {
    const auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u)) {
      stem.push_back(static_cast<char>(std::tolower(u)));
    } else if (c == ' ' || c == '_') {
      stem.push_back('_');
    } else if (c == '-') {
      stem.push_back('-');
    }
  }
  // trim separators left by leading/trailing spaces
  const auto first = stem.find_first_not_of("_-");
  stem             = first == std::string::npos ? std::string() : stem.substr(first, stem.find_last_not_of("_-") - first + 1);
  if (stem.empty()) stem = "collection";

  if (config.generations_size() > 0) {
    const std::set<uint32_t> gens(config.generations().begin(), config.generations().end());
    std::string              suffix;
    for (auto g : gens) {
      suffix += (suffix.empty() ? "" : "-") + std::to_string(g);
    }
    stem += "_gen" + suffix;
  }
  return stem;
}

} // namespace cardposter::layout
