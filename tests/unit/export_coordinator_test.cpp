#include "internal/export/export_coordinator.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_cache_index.hpp"
#include "internal/export/export_history.hpp"
#include "internal/image/image_codec.hpp"
#include "internal/layout/layout_engine.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fake_fetcher.hpp"

namespace {

using cardposter::exporter::ExportCoordinator;
using cardposter::exporter::ExportOutcome;
using cardposter::exporter::ExportResult;
using cardposter::exporter::JobContext;
using cardposter::exporter::JobState;
using cardposter::exporter::ProgressUpdate;
using cardposter::image::Color;
using cardposter::testing::FakeFetcher;
using cardposter::testing::SolidPng;
using cardposter::v1::CardRef;
using cardposter::v1::ExportConfig;

namespace fs = std::filesystem;

const Color kPlaceholderFill{220, 220, 220, 255};

std::string UrlFor(const std::string& id) {
  return "https://images.example/cards/" + id + ".png";
}

Color ColorFor(size_t i) {
  return {static_cast<uint8_t>(20 + i * 30), static_cast<uint8_t>(200 - i * 20), 90, 255};
}

std::vector<CardRef> MakeCards(size_t n) {
  std::vector<CardRef> cards;
  for (size_t i = 0; i < n; ++i) {
    CardRef card;
    card.set_id("c" + std::to_string(i));
    card.set_name("Card " + std::to_string(i));
    card.set_generation(1);
    card.set_dex_number(static_cast<uint32_t>(i + 1));
    card.set_image_url(UrlFor(card.id()));
    cards.push_back(card);
  }
  return cards;
}

fs::path FreshDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "cardposter_export_tests" / name;
  fs::remove_all(dir);
  return dir;
}

ExportConfig MakeConfig(const fs::path& output_dir) {
  ExportConfig config;
  config.set_cards_per_row(3);
  config.set_quality(cardposter::v1::QUALITY_TIER_LOW);
  config.set_title("Export Test");
  config.set_format(cardposter::v1::OUTPUT_FORMAT_PNG);
  config.set_output_dir(output_dir.string());
  config.add_labels(cardposter::v1::LABEL_FIELD_DEX_NUMBER);
  return config;
}

// Index whose transactions cannot start: every cache lookup is a storage failure.
class BrokenIndex final : public cardposter::db::CacheIndex {
 public:
  std::unique_ptr<cardposter::db::Transaction> Begin() override {
    throw std::runtime_error("database disk image is malformed");
  }
  std::optional<cardposter::db::model::CacheEntryRecord> Get(cardposter::db::Transaction&, const std::string&) override {
    return std::nullopt;
  }
  std::vector<cardposter::db::model::CacheEntryRecord> List(cardposter::db::Transaction&) override {
    return {};
  }
  cardposter::db::Result Upsert(cardposter::db::Transaction&, const cardposter::db::model::CacheEntryRecord&) override {
    return cardposter::db::Result::Err(cardposter::db::ErrorCode::Corruption);
  }
  cardposter::db::Result Touch(cardposter::db::Transaction&, const std::string&, uint64_t) override {
    return cardposter::db::Result::Err(cardposter::db::ErrorCode::Corruption);
  }
  cardposter::db::Result SetStatus(cardposter::db::Transaction&, const std::string&, cardposter::db::model::CacheStatus) override {
    return cardposter::db::Result::Err(cardposter::db::ErrorCode::Corruption);
  }
  cardposter::db::Result Delete(cardposter::db::Transaction&, const std::string&) override {
    return cardposter::db::Result::Err(cardposter::db::ErrorCode::Corruption);
  }
};

struct Harness {
  std::shared_ptr<FakeFetcher>                   fetcher = std::make_shared<FakeFetcher>();
  std::shared_ptr<cardposter::db::CacheIndex>    index   = std::make_shared<cardposter::db::memory::MemoryCacheIndex>();
  std::shared_ptr<cardposter::cache::CacheStore> cache;

  uint32_t download_workers = 4;

  cardposter::download::DownloaderOptions options;

  Harness() {
    options.retry.base_backoff = std::chrono::milliseconds(1);
    options.retry.max_backoff  = std::chrono::milliseconds(2);
    Reset();
  }

  void Reset() {
    cache = std::make_shared<cardposter::cache::CacheStore>(index, std::make_shared<cardposter::storage::RamBlobStore>(),
                                                            cardposter::cache::CacheOptions{});
  }

  // Serves every card except the listed ones; those answer 404.
  void ServeAllBut(const std::vector<CardRef>& cards, const std::vector<std::string>& missing) {
    for (size_t i = 0; i < cards.size(); ++i) {
      if (std::find(missing.begin(), missing.end(), cards[i].id()) != missing.end()) continue;
      fetcher->Serve(cards[i].image_url(), SolidPng(60, 84, ColorFor(i)));
    }
  }

  JobContext Context() const {
    JobContext ctx;
    ctx.cache            = cache;
    ctx.downloader       = std::make_shared<cardposter::download::Downloader>(cache, fetcher, options);
    ctx.render.fsync     = false;
    ctx.download_workers = download_workers;
    ctx.clock            = [] { return cardposter::util::FromUnixMillis(1'700'000'000'000ull); };
    return ctx;
  }
};

cardposter::image::Image DecodeFile(const std::string& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  const auto bytes = out.str();
  return cardposter::image::Decode(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

Color PixelAt(const cardposter::image::Image& img, int x, int y) {
  const auto* p = &img.pixels[(static_cast<size_t>(y) * img.width + x) * 4];
  return {p[0], p[1], p[2], p[3]};
}

bool Same(Color a, Color b) {
  return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

void TestPartialFailureCompletesWithPlaceholdersInPlace() {
  Harness    h;
  const auto cards = MakeCards(7);
  h.ServeAllBut(cards, {"c2", "c5"});

  const auto dir    = FreshDir("partial");
  const auto config = MakeConfig(dir);

  ExportCoordinator coordinator(h.Context());
  const auto        result = coordinator.Run(cards, config);

  assert(result.outcome == ExportOutcome::kExportedWithPlaceholders);
  assert(result.final_state == JobState::kCompleted);
  assert(coordinator.State() == JobState::kCompleted);
  assert(result.counts.total == 7);
  assert(result.counts.processed == 7);
  assert(result.counts.succeeded == 5);
  assert(result.counts.placeholder == 2);
  assert(result.counts.failed == 0);
  assert(result.counts.from_network == 5);
  assert(result.artifacts.size() == 1);
  assert(result.artifacts[0] == (dir / "export_test_p001.png").string());
  assert(fs::exists(result.artifacts[0]));

  // 3 per row: rows of 3, 3, 1
  assert(result.pages.size() == 1);
  assert(result.pages[0].placeholders == 2);

  const auto page    = DecodeFile(result.artifacts[0]);
  const auto profile = cardposter::layout::ProfileFor(config.quality());
  const auto plan    = cardposter::layout::LayoutEngine::Plan(cardposter::layout::LayoutEngine::FilterAndSort(cards, config), config, profile);
  const auto g       = cardposter::layout::LayoutEngine::GeometryFor(plan[0], profile);
  assert(page.width == g.width && page.height == g.height);

  for (size_t i = 0; i < result.cards.size(); ++i) {
    const auto& outcome = result.cards[i];
    const auto  box     = cardposter::layout::LayoutEngine::CellRect(g, outcome.row, outcome.column);
    assert(outcome.row == i / 3 && outcome.column == i % 3);

    if (outcome.card_id == "c2" || outcome.card_id == "c5") {
      assert(outcome.origin == cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER);
      assert(outcome.failure_reason == "HTTP 404");
      assert(Same(PixelAt(page, box.x + 5, box.y + 5), kPlaceholderFill));
    } else {
      assert(outcome.origin == cardposter::v1::IMAGE_ORIGIN_NETWORK);
      assert(outcome.failure_reason.empty());
      assert(Same(PixelAt(page, box.x + box.w / 2, box.y + box.h / 2), ColorFor(i)));
    }
  }
}

void TestSecondExportIsServedFromCache() {
  Harness    h;
  const auto cards = MakeCards(7);
  h.ServeAllBut(cards, {"c2", "c5"});

  const auto config = MakeConfig(FreshDir("second_run"));
  {
    ExportCoordinator coordinator(h.Context());
    (void)coordinator.Run(cards, config);
  }
  const int calls_after_first = h.fetcher->Calls();

  ExportCoordinator coordinator(h.Context());
  const auto        second = coordinator.Run(cards, config);

  assert(second.counts.from_cache == 5);
  assert(second.counts.from_network == 0);
  assert(second.counts.placeholder == 2);
  // only the two missing images are asked for again
  assert(h.fetcher->Calls() == calls_after_first + 2);
  for (const auto& card : cards) {
    if (card.id() == "c2" || card.id() == "c5") continue;
    assert(h.fetcher->CallsFor(card.image_url()) == 1);
  }
}

void TestCacheOptOutAlwaysFetches() {
  Harness    h;
  const auto cards = MakeCards(4);
  h.ServeAllBut(cards, {});

  auto config = MakeConfig(FreshDir("opt_out"));
  config.set_cache_opt_out(true);

  ExportCoordinator coordinator(h.Context());
  (void)coordinator.Run(cards, config);
  const auto second = coordinator.Run(cards, config);

  assert(second.outcome == ExportOutcome::kExported);
  assert(second.counts.from_network == 4);
  assert(second.counts.from_cache == 0);
  assert(h.fetcher->Calls() == 8);
  assert(h.cache->Stats().active_entries == 0);
}

void TestMultiplePagesAreNumbered() {
  Harness    h;
  const auto cards = MakeCards(13);
  h.ServeAllBut(cards, {});

  auto ctx        = h.Context();
  ctx.budgets.low = 12ull * 130 * 208;

  auto config = MakeConfig(FreshDir("pages"));
  config.set_file_stem("binder");

  ExportCoordinator coordinator(ctx);
  const auto        result = coordinator.Run(cards, config);

  assert(result.outcome == ExportOutcome::kExported);
  assert(result.counts.succeeded == 13);
  assert(result.artifacts.size() == 2);
  assert(fs::exists(fs::path(config.output_dir()) / "binder_p001.png"));
  assert(fs::exists(fs::path(config.output_dir()) / "binder_p002.png"));
  assert(result.pages[1].card_count == 1);
  assert(result.cards[12].page_index == 1);
}

void TestNothingToExport() {
  Harness    h;
  const auto dir    = FreshDir("nothing");
  auto       config = MakeConfig(dir);
  config.add_generations(9);

  ExportCoordinator coordinator(h.Context());
  const auto        result = coordinator.Run(MakeCards(5), config);

  assert(result.outcome == ExportOutcome::kNothingToExport);
  assert(result.counts.total == 0);
  assert(result.artifacts.empty());
  assert(!fs::exists(dir));
  assert(h.fetcher->Calls() == 0);
}

void TestInvalidConfigThrowsBeforeWork() {
  Harness h;
  auto    config = MakeConfig(FreshDir("invalid"));
  config.set_cards_per_row(7);

  ExportCoordinator coordinator(h.Context());
  bool              threw = false;
  try {
    (void)coordinator.Run(MakeCards(3), config);
  } catch (const cardposter::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
  assert(h.fetcher->Calls() == 0);

  auto ctx      = h.Context();
  ctx.max_cards = 2;
  ExportCoordinator limited(ctx);
  threw = false;
  try {
    (void)limited.Run(MakeCards(3), MakeConfig(FreshDir("invalid")));
  } catch (const cardposter::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestUnwritableOutputFailsToWrite() {
  Harness    h;
  const auto cards = MakeCards(7);
  h.ServeAllBut(cards, {"c2", "c5"});

  const auto blocker = FreshDir("blocker");
  fs::create_directories(blocker.parent_path());
  std::ofstream(blocker) << "a file where the output directory should be";

  ExportCoordinator coordinator(h.Context());
  const auto        result = coordinator.Run(cards, MakeConfig(blocker / "out"));

  assert(result.outcome == ExportOutcome::kFailedToWrite);
  assert(result.artifacts.empty());
  assert(!result.pages[0].written);
  assert(!result.pages[0].error.empty());
  assert(result.counts.failed == 7);
  assert(result.counts.placeholder == 0);
  assert(result.counts.succeeded == 0);

  fs::remove(blocker);
}

void TestCancellationFromProgressCallback() {
  Harness    h;
  const auto cards = MakeCards(20);
  h.ServeAllBut(cards, {});
  h.fetcher->SetLatency(std::chrono::milliseconds(20));
  h.download_workers = 1;

  const auto        dir = FreshDir("cancel");
  ExportCoordinator coordinator(h.Context());

  std::vector<JobState> states;
  const auto            result = coordinator.Run(cards, MakeConfig(dir), [&](const ProgressUpdate& p) {
    if (states.empty() || states.back() != p.state) states.push_back(p.state);
    if (p.processed >= 3) coordinator.Cancel();
  });

  assert(result.outcome == ExportOutcome::kCancelled);
  assert(result.final_state == JobState::kCancelled);
  assert(coordinator.State() == JobState::kCancelled);
  assert(result.counts.processed >= 3);
  assert(result.counts.processed < 20);
  assert(result.artifacts.empty());
  assert(!fs::exists(dir / "export_test_p001.png"));
  assert(states.back() == JobState::kCancelled);
  for (auto s : states) assert(s != JobState::kRendering);
  assert(result.counts.placeholder == 0);
  assert(result.counts.cancelled == result.counts.total - result.counts.processed);
}

void TestCancelAfterFirstPageDiscardsWrittenPages() {
  Harness    h;
  const auto cards = MakeCards(40);
  h.ServeAllBut(cards, {});
  h.fetcher->SetLatency(std::chrono::milliseconds(10));
  h.download_workers = 1;

  // 12 cells per page: pages of 12, 12, 12, 4
  auto ctx        = h.Context();
  ctx.budgets.low = 12ull * 130 * 208;

  const auto        dir = FreshDir("cancel_after_page");
  ExportCoordinator coordinator(ctx);
  const auto        result = coordinator.Run(cards, MakeConfig(dir), [&](const ProgressUpdate& p) {
    if (p.pages_done >= 1) coordinator.Cancel();
  });

  assert(result.outcome == ExportOutcome::kCancelled);
  assert(result.final_state == JobState::kCancelled);
  assert(result.pages.size() == 4);
  assert(result.artifacts.empty());

  const auto first_page = (dir / "export_test_p001.png").string();
  assert(!result.discarded.empty());
  assert(std::find(result.discarded.begin(), result.discarded.end(), first_page) != result.discarded.end());
  for (const auto& path : result.discarded) assert(!fs::exists(path));
  assert(result.pages[0].discarded);
  assert(!result.pages[0].written);

  if (fs::exists(dir)) {
    for (const auto& entry : fs::directory_iterator(dir)) {
      assert(entry.path().extension() != ".png");
    }
  }

  assert(result.counts.processed >= 12);
  assert(result.counts.processed < 40);
  assert(result.counts.placeholder == 0);
  assert(result.counts.cancelled == 40 - result.counts.processed);
}

void TestCancelDuringBackoffIsNotCountedAsPlaceholder() {
  Harness    h;
  const auto cards = MakeCards(4);
  for (const auto& card : cards) {
    h.fetcher->Script(card.image_url(), {cardposter::testing::HttpResponse(503)});
  }
  h.options.retry.max_retries  = 20;
  h.options.retry.base_backoff = std::chrono::milliseconds(400);
  h.options.retry.max_backoff  = std::chrono::milliseconds(800);

  ExportCoordinator coordinator(h.Context());
  std::thread       canceller;
  const auto        result = coordinator.Run(cards, MakeConfig(FreshDir("cancel_backoff")), [&](const ProgressUpdate& p) {
    if (p.state == JobState::kResolving && !canceller.joinable()) {
      canceller = std::thread([&coordinator] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        coordinator.Cancel();
      });
    }
  });
  if (canceller.joinable()) canceller.join();

  assert(result.outcome == ExportOutcome::kCancelled);
  assert(result.counts.total == 4);
  assert(result.counts.processed == 0);
  assert(result.counts.placeholder == 0);
  assert(result.counts.cancelled == 4);
  for (const auto& card : result.cards) {
    assert(card.origin == cardposter::v1::IMAGE_ORIGIN_UNSPECIFIED);
    assert(card.failure_reason.empty());
  }
}

void TestResidentImagesStayWithinDispatchWindow() {
  Harness    h;
  const auto cards = MakeCards(30);
  h.ServeAllBut(cards, {});

  // 3 cells per page, 10 pages; one render at a time keeps two pages in flight
  auto ctx               = h.Context();
  ctx.budgets.low        = 3ull * 130 * 208;
  ctx.max_parallel_pages = 1;

  std::vector<ProgressUpdate> updates;
  ExportCoordinator           coordinator(ctx);
  const auto result = coordinator.Run(cards, MakeConfig(FreshDir("window")), [&](const ProgressUpdate& p) { updates.push_back(p); });

  assert(result.outcome == ExportOutcome::kExported);
  assert(result.artifacts.size() == 10);
  assert(result.counts.succeeded == 30);
  assert(result.peak_resident_images > 0);
  assert(result.peak_resident_images <= 6);

  for (const auto& u : updates) {
    assert(u.processed <= (u.pages_done + 2) * 3);
  }
}

void TestCancelWhileIdleHasNoEffect() {
  Harness    h;
  const auto cards = MakeCards(3);
  h.ServeAllBut(cards, {});

  ExportCoordinator coordinator(h.Context());
  coordinator.Cancel();
  const auto result = coordinator.Run(cards, MakeConfig(FreshDir("idle_cancel")));
  assert(result.outcome == ExportOutcome::kExported);
}

void TestProgressIsReportedInOrder() {
  Harness    h;
  const auto cards = MakeCards(6);
  h.ServeAllBut(cards, {});

  std::vector<ProgressUpdate> updates;
  ExportCoordinator           coordinator(h.Context());
  (void)coordinator.Run(cards, MakeConfig(FreshDir("progress")), [&](const ProgressUpdate& p) { updates.push_back(p); });

  assert(!updates.empty());
  assert(updates.front().state == JobState::kPlanning);
  assert(updates.back().state == JobState::kCompleted);
  assert(updates.back().processed == 6);
  assert(updates.back().pages_done == 1);

  uint32_t last_processed = 0;
  bool     saw_resolving = false;
  bool     saw_rendering = false;
  for (const auto& u : updates) {
    assert(u.processed >= last_processed);
    assert(u.processed <= u.total);
    last_processed = u.processed;
    saw_resolving  = saw_resolving || u.state == JobState::kResolving;
    saw_rendering  = saw_rendering || u.state == JobState::kRendering;
  }
  assert(saw_resolving && saw_rendering);
}

void TestManifestDescribesExport() {
  Harness    h;
  const auto cards = MakeCards(7);
  h.ServeAllBut(cards, {"c2", "c5"});

  const auto dir    = FreshDir("manifest");
  auto       config = MakeConfig(dir);
  config.set_write_manifest(true);

  ExportCoordinator coordinator(h.Context());
  const auto        result = coordinator.Run(cards, config);

  assert(result.manifest_path == (dir / "export_test_manifest.json").string());
  std::ifstream      in(result.manifest_path);
  std::ostringstream json;
  json << in.rdbuf();

  cardposter::v1::ExportManifest manifest;
  assert(google::protobuf::util::JsonStringToMessage(json.str(), &manifest).ok());
  assert(manifest.title() == "Export Test");
  assert(manifest.counts().succeeded() == 5);
  assert(manifest.counts().placeholder() == 2);
  assert(manifest.pages_size() == 1);
  assert(manifest.pages(0).path() == "export_test_p001.png");
  assert(manifest.pages(0).written());
  assert(manifest.pages(0).cards_size() == 7);
  assert(manifest.pages(0).cards(2).origin() == cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER);
  assert(manifest.cards_size() == 7);
  assert(manifest.config().cards_per_row() == 3);
}

void TestCardListCsvBesidePages() {
  Harness h;
  auto    cards = MakeCards(7);
  cards[1].set_name("Mr. Mime, Jr.");
  cards[2].set_artist("Ken \"Sugimori\"");
  h.ServeAllBut(cards, {"c2"});

  const auto dir    = FreshDir("csv");
  auto       config = MakeConfig(dir);
  config.set_write_csv(true);

  ExportCoordinator coordinator(h.Context());
  const auto        result = coordinator.Run(cards, config);

  assert(result.outcome == ExportOutcome::kExportedWithPlaceholders);
  assert(result.csv_path == (dir / "export_test_cards.csv").string());

  std::ifstream            in(result.csv_path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) lines.push_back(line);

  assert(lines.size() == 8);
  assert(lines[0] == "card_id,name,set_name,artist,generation,dex_number,image_url,page,row,column,origin,failure_reason");
  assert(lines[1] == "c0,Card 0,,,1,1,https://images.example/cards/c0.png,1,1,1,network,");
  assert(lines[2] == "c1,\"Mr. Mime, Jr.\",,,1,2,https://images.example/cards/c1.png,1,1,2,network,");
  assert(lines[3] == "c2,Card 2,,\"Ken \"\"Sugimori\"\"\",1,3,https://images.example/cards/c2.png,1,1,3,placeholder,HTTP 404");
  assert(lines[7] == "c6,Card 6,,,1,7,https://images.example/cards/c6.png,1,3,1,network,");
}

void TestCsvNotWrittenUnlessRequested() {
  Harness    h;
  const auto cards = MakeCards(2);
  h.ServeAllBut(cards, {});

  const auto        dir = FreshDir("no_csv");
  ExportCoordinator coordinator(h.Context());
  const auto        result = coordinator.Run(cards, MakeConfig(dir));

  assert(result.outcome == ExportOutcome::kExported);
  assert(result.csv_path.empty());
  assert(!fs::exists(dir / "export_test_cards.csv"));
}

void TestJobsAreAppendedToHistory() {
  Harness    h;
  const auto cards = MakeCards(7);
  h.ServeAllBut(cards, {"c2", "c5"});

  const auto history_dir = FreshDir("history");
  auto       ctx         = h.Context();
  ctx.history            = std::make_shared<cardposter::exporter::ExportHistory>(history_dir / "history.jsonl");

  const auto dir    = FreshDir("history_out");
  auto       config = MakeConfig(dir);
  config.set_write_csv(true);

  ExportCoordinator coordinator(ctx);
  const auto        exported = coordinator.Run(cards, config);

  auto nothing = config;
  nothing.add_generations(9);
  (void)coordinator.Run(cards, nothing);

  const auto records = ctx.history->List();
  assert(records.size() == 2);

  const auto& first = records[0];
  assert(first.outcome() == "exported_with_placeholders");
  assert(first.title() == "Export Test");
  assert(first.exported_at() == cardposter::util::FormatIso8601(cardposter::util::FromUnixMillis(1'700'000'000'000ull)));
  assert(first.format() == cardposter::v1::OUTPUT_FORMAT_PNG);
  assert(first.pages() == 1);
  assert(first.artifacts_size() == 1);
  assert(first.artifacts(0) == exported.artifacts[0]);
  assert(first.total_bytes() == fs::file_size(exported.artifacts[0]));
  assert(first.csv_path() == exported.csv_path);
  assert(first.counts().succeeded() == 5);
  assert(first.counts().placeholder() == 2);

  assert(records[1].outcome() == "nothing_to_export");
  assert(records[1].artifacts_size() == 0);
}

void TestBrokenCacheFailsJob() {
  Harness    h;
  const auto cards = MakeCards(5);
  h.ServeAllBut(cards, {});
  h.index = std::make_shared<BrokenIndex>();
  h.Reset();

  const auto        dir = FreshDir("broken_cache");
  ExportCoordinator coordinator(h.Context());
  const auto        result = coordinator.Run(cards, MakeConfig(dir));

  assert(result.outcome == ExportOutcome::kFailed);
  assert(result.message.find("malformed") != std::string::npos);
  assert(result.artifacts.empty());
  assert(!fs::exists(dir / "export_test_p001.png"));
}

void TestStateTransitions() {
  using cardposter::exporter::CanTransition;

  assert(CanTransition(JobState::kIdle, JobState::kPlanning));
  assert(CanTransition(JobState::kPlanning, JobState::kResolving));
  assert(CanTransition(JobState::kResolving, JobState::kRendering));
  assert(CanTransition(JobState::kPlanning, JobState::kCompleted));
  assert(CanTransition(JobState::kRendering, JobState::kCancelled));

  assert(!CanTransition(JobState::kIdle, JobState::kResolving));
  assert(!CanTransition(JobState::kIdle, JobState::kCancelled));
  assert(!CanTransition(JobState::kRendering, JobState::kResolving));
  assert(!CanTransition(JobState::kCompleted, JobState::kPlanning));
  assert(!CanTransition(JobState::kCancelled, JobState::kCompleted));
}

} // namespace

int main() {
  TestStateTransitions();
  TestPartialFailureCompletesWithPlaceholdersInPlace();
  TestSecondExportIsServedFromCache();
  TestCacheOptOutAlwaysFetches();
  TestMultiplePagesAreNumbered();
  TestNothingToExport();
  TestInvalidConfigThrowsBeforeWork();
  TestUnwritableOutputFailsToWrite();
  TestCancellationFromProgressCallback();
  TestCancelAfterFirstPageDiscardsWrittenPages();
  TestCancelDuringBackoffIsNotCountedAsPlaceholder();
  TestResidentImagesStayWithinDispatchWindow();
  TestCancelWhileIdleHasNoEffect();
  TestProgressIsReportedInOrder();
  TestManifestDescribesExport();
  TestCardListCsvBesidePages();
  TestCsvNotWrittenUnlessRequested();
  TestJobsAreAppendedToHistory();
  TestBrokenCacheFailsJob();

  std::cout << "cardposter_unit_export_coordinator: pass\n";
  return 0;
}
