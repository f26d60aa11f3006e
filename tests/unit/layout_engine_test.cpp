#include "internal/layout/layout_engine.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using cardposter::layout::LayoutEngine;
using cardposter::layout::PixelBudgets;
using cardposter::layout::ProfileFor;
using cardposter::v1::CardRef;
using cardposter::v1::ExportConfig;

CardRef Card(const std::string& id, uint32_t generation, uint32_t dex, const std::string& name) {
  CardRef card;
  card.set_id(id);
  card.set_name(name);
  card.set_generation(generation);
  card.set_dex_number(dex);
  card.set_image_url("https://images.example/" + id + ".png");
  return card;
}

std::vector<CardRef> Cards(uint32_t n) {
  std::vector<CardRef> cards;
  for (uint32_t i = 0; i < n; ++i) {
    cards.push_back(Card("c" + std::to_string(i), 1, i + 1, "Card " + std::to_string(i)));
  }
  return cards;
}

ExportConfig Config(uint32_t cards_per_row, cardposter::v1::QualityTier quality = cardposter::v1::QUALITY_TIER_LOW) {
  ExportConfig config;
  config.set_cards_per_row(cards_per_row);
  config.set_quality(quality);
  config.set_output_dir("/tmp/out");
  config.set_title("Test");
  return config;
}

// LOW cell is 130 x 208 px; a budget of exactly 12 cells holds 12 cards at 3 per row
PixelBudgets TwelveCellBudget() {
  PixelBudgets budgets;
  budgets.low = 12ull * 130 * 208;
  return budgets;
}

void TestProfiles() {
  auto low = ProfileFor(cardposter::v1::QUALITY_TIER_LOW);
  assert(low.CellWidth() == 130);
  assert(low.label_band == 30);
  assert(low.CellHeight() == 208);

  auto high = ProfileFor(cardposter::v1::QUALITY_TIER_HIGH);
  assert(high.label_band == 60);
  assert(high.card_width == 245 && high.card_height == 342);

  bool threw = false;
  try {
    (void)ProfileFor(cardposter::v1::QUALITY_TIER_UNSPECIFIED);
  } catch (const cardposter::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestFilterAndSort() {
  std::vector<CardRef> cards = {
      Card("b", 2, 152, "Chikorita"), Card("a", 1, 25, "Pikachu"), Card("c", 1, 1, "Bulbasaur"),
      Card("d", 1, 25, "Flying Pikachu"), Card("e", 3, 252, "Treecko"),
  };

  auto config = Config(3);
  auto all    = LayoutEngine::FilterAndSort(cards, config);
  assert(all.size() == 5);
  assert(all[0].id() == "c");
  assert(all[1].id() == "d"); // same dex, name order
  assert(all[2].id() == "a");
  assert(all[3].id() == "b");
  assert(all[4].id() == "e");

  config.add_generations(1);
  config.add_generations(3);
  auto filtered = LayoutEngine::FilterAndSort(cards, config);
  assert(filtered.size() == 4);
  for (const auto& card : filtered) assert(card.generation() != 2);
}

void TestValidate() {
  auto expect_invalid = [](const ExportConfig& config, uint32_t max_cards, size_t count, const PixelBudgets& budgets = {}) {
    bool threw = false;
    try {
      LayoutEngine::Validate(config, budgets, max_cards, count);
    } catch (const cardposter::util::InvalidConfig&) {
      threw = true;
    }
    assert(threw);
  };

  LayoutEngine::Validate(Config(2), {}, 1000, 10);
  LayoutEngine::Validate(Config(5), {}, 1000, 10);
  expect_invalid(Config(1), 1000, 10);
  expect_invalid(Config(6), 1000, 10);
  expect_invalid(Config(3, cardposter::v1::QUALITY_TIER_UNSPECIFIED), 1000, 10);

  auto no_dir = Config(3);
  no_dir.clear_output_dir();
  expect_invalid(no_dir, 1000, 10);

  expect_invalid(Config(3), 100, 101);

  // a page must hold at least one full row
  PixelBudgets three_cells;
  three_cells.low = 3ull * 130 * 208;
  LayoutEngine::Validate(Config(3), three_cells, 1000, 10);
  expect_invalid(Config(5), 1000, 10, three_cells);
  expect_invalid(Config(4), 1000, 10, three_cells);
}

void TestPaginationBoundary() {
  const auto profile = ProfileFor(cardposter::v1::QUALITY_TIER_LOW, TwelveCellBudget());
  const auto config  = Config(3);
  assert(LayoutEngine::CellsPerPage(profile, 3) == 12);

  auto exact = LayoutEngine::Plan(Cards(12), config, profile);
  assert(exact.size() == 1);
  assert(exact[0].rows == 4);
  assert(exact[0].cells.size() == 12);

  auto over = LayoutEngine::Plan(Cards(13), config, profile);
  assert(over.size() == 2);
  assert(over[0].cells.size() == 12);
  assert(over[1].cells.size() == 1);
  assert(over[1].rows == 1);
  assert(over[1].page_count == 2);
  assert(over[1].cells[0].row == 0 && over[1].cells[0].column == 0);
}

void TestCapacityRoundsDownToWholeRows() {
  PixelBudgets budgets;
  budgets.low        = 14ull * 130 * 208; // 14 cells fit, only 4 full rows of 3
  const auto profile = ProfileFor(cardposter::v1::QUALITY_TIER_LOW, budgets);
  assert(LayoutEngine::CellsPerPage(profile, 3) == 12);

  // exactly one row fits
  budgets.low       = 5ull * 130 * 208;
  const auto narrow = ProfileFor(cardposter::v1::QUALITY_TIER_LOW, budgets);
  assert(LayoutEngine::CellsPerPage(narrow, 5) == 5);
  assert(LayoutEngine::CellsPerPage(narrow, 2) == 4);
}

void TestEveryCardPlacedOnceInUniqueCell() {
  const auto profile = ProfileFor(cardposter::v1::QUALITY_TIER_LOW, TwelveCellBudget());
  const auto cards   = Cards(31);
  const auto pages   = LayoutEngine::Plan(cards, Config(3), profile);

  std::set<std::string>                                    ids;
  std::set<std::pair<uint32_t, std::pair<uint32_t, uint32_t>>> cells;
  for (const auto& page : pages) {
    for (const auto& cell : page.cells) {
      assert(cell.column < page.columns);
      assert(cell.row < page.rows);
      assert(ids.insert(cell.card.id()).second);
      assert(cells.insert({page.page_index, {cell.row, cell.column}}).second);
    }
  }
  assert(ids.size() == cards.size());
  assert(pages.size() == 3);
}

void TestLayoutIsDeterministic() {
  const auto profile = ProfileFor(cardposter::v1::QUALITY_TIER_MEDIUM);
  auto       cards   = Cards(40);
  const auto a       = LayoutEngine::Plan(LayoutEngine::FilterAndSort(cards, Config(4)), Config(4), profile);

  std::reverse(cards.begin(), cards.end());
  const auto b = LayoutEngine::Plan(LayoutEngine::FilterAndSort(cards, Config(4)), Config(4), profile);

  assert(a.size() == b.size());
  for (size_t p = 0; p < a.size(); ++p) {
    assert(a[p].cells.size() == b[p].cells.size());
    for (size_t i = 0; i < a[p].cells.size(); ++i) {
      assert(a[p].cells[i].card.id() == b[p].cells[i].card.id());
      assert(a[p].cells[i].row == b[p].cells[i].row);
      assert(a[p].cells[i].column == b[p].cells[i].column);
    }
  }
}

void TestGeometry() {
  const auto profile = ProfileFor(cardposter::v1::QUALITY_TIER_LOW, TwelveCellBudget());
  const auto pages   = LayoutEngine::Plan(Cards(12), Config(3), profile);
  const auto g       = LayoutEngine::GeometryFor(pages[0], profile);

  assert(g.width == 3 * 130 + 10);
  assert(g.height == 80 + 4 * 208 + 10 + 60);
  assert(g.footer.y == g.height - 60);

  const auto cell = LayoutEngine::CellRect(g, 1, 2);
  assert(cell.x == 10 + 2 * 130);
  assert(cell.y == 80 + 10 + 208);
  assert(cell.w == 120 && cell.h == 168);

  const auto label = LayoutEngine::LabelRect(g, 1, 2);
  assert(label.y == cell.y + 168);
  assert(label.h == 30);
}

void TestEstimate() {
  const auto profile = ProfileFor(cardposter::v1::QUALITY_TIER_LOW, TwelveCellBudget());

  auto est = LayoutEngine::Estimate(Cards(13), Config(3), profile);
  assert(est.card_count == 13);
  assert(est.pages == 2);
  assert(est.cells_per_page == 12);
  assert(est.page_dimensions.size() == 2);
  assert(est.page_dimensions[1].height == 80 + 208 + 10 + 60);
  assert(est.raw_megabytes > 0);
  assert(est.warnings.empty());

  auto empty = LayoutEngine::Estimate({}, Config(3), profile);
  assert(empty.pages == 0);
  assert(empty.warnings.size() == 1);

  auto big = LayoutEngine::Estimate(Cards(501), Config(5), ProfileFor(cardposter::v1::QUALITY_TIER_LOW));
  bool large_collection_warned = false;
  for (const auto& w : big.warnings) {
    if (w.find("large collection") != std::string::npos) large_collection_warned = true;
  }
  assert(large_collection_warned);
}

void TestArtifactStem() {
  auto config = Config(3);
  config.set_title("  My Base-Set Collection! ");
  assert(LayoutEngine::ArtifactStem(config) == "my_base-set_collection");

  config.add_generations(3);
  config.add_generations(1);
  assert(LayoutEngine::ArtifactStem(config) == "my_base-set_collection_gen1-3");

  config.set_title("!!!");
  config.clear_generations();
  assert(LayoutEngine::ArtifactStem(config) == "collection");

  config.set_file_stem("poster");
  assert(LayoutEngine::ArtifactStem(config) == "poster");
}

} // namespace

int main() {
  TestProfiles();
  TestFilterAndSort();
  TestValidate();
  TestPaginationBoundary();
  TestCapacityRoundsDownToWholeRows();
  TestEveryCardPlacedOnceInUniqueCell();
  TestLayoutIsDeterministic();
  TestGeometry();
  TestEstimate();
  TestArtifactStem();

  std::cout << "cardposter_unit_layout_engine: pass\n";
  return 0;
}
