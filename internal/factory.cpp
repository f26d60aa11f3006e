#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_cache_index.hpp"
#include "internal/db/sqlite/sqlite_cache_index.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/fetch/curl_fetcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/disk/disk_blob_store.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"

namespace cardposter::factory {

using cardposter::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

void BootstrapSqliteSchema(db::sqlite::SqliteDB& sqlite_db) {
  db::sqlite::SqliteCacheIndex::Bootstrap(sqlite_db);

  // fail fast on an index written by an incompatible build
  sqlite_db.Exec(
      "SELECT key,source_url,blob_ref,content_hash,size_bytes,fetched_at_ms,last_accessed_ms,access_count,version,status "
      "FROM cache_entries LIMIT 1;");
}

std::shared_ptr<db::CacheIndex> BuildIndex(const RuntimeConfig& config) {
  const auto& cache = config.cache();
  if (cache.has_memory()) {
    return std::make_shared<db::memory::MemoryCacheIndex>();
  }

  const auto& sqlite = cache.sqlite();
  if (sqlite.path().empty()) {
    throw util::InvalidConfig("cache.sqlite.path must be set");
  }

  const auto parent = std::filesystem::path(sqlite.path()).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
  BootstrapSqliteSchema(*sqlite_db);
  return std::make_shared<db::sqlite::SqliteCacheIndex>(std::move(sqlite_db));
}

storage::BlobStorePtr BuildBlobStore(const RuntimeConfig& config) {
  if (config.cache().has_memory()) {
    return std::make_shared<storage::RamBlobStore>();
  }
  if (config.cache().root().empty()) {
    throw util::InvalidConfig("cache.root must be set");
  }
  return std::make_shared<storage::DiskBlobStore>(std::filesystem::path(config.cache().root()) / "blobs");
}

} // namespace

download::DownloaderOptions DownloaderOptionsFrom(const cardposter::runtime::config::DownloaderConfig& config) {
  download::DownloaderOptions options;
  options.retry.max_retries  = config.max_retries();
  options.retry.base_backoff = std::chrono::milliseconds(config.base_backoff_ms());
  options.retry.max_backoff  = std::chrono::milliseconds(config.max_backoff_ms());
  options.timeout            = std::chrono::milliseconds(config.timeout_ms());
  options.max_image_bytes    = config.max_image_bytes();
  options.user_agent         = config.user_agent();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, fetch::FetcherPtr fetcher) {
  Application app;

  // ------------------------------------------------------------------
  // Cache
  // ------------------------------------------------------------------
  app.index = BuildIndex(config);
  app.blobs = BuildBlobStore(config);

  cache::CacheOptions cache_options;
  cache_options.max_bytes = config.cache().max_bytes();
  cache_options.ttl_days  = config.cache().ttl_days();
  cache_options.fsync     = config.cache().fsync();
  app.cache               = std::make_shared<cache::CacheStore>(app.index, app.blobs, cache_options);

  // ------------------------------------------------------------------
  // Network
  // ------------------------------------------------------------------
  app.fetcher    = fetcher ? std::move(fetcher) : std::make_shared<fetch::CurlFetcher>();
  app.downloader = std::make_shared<download::Downloader>(app.cache, app.fetcher, DownloaderOptionsFrom(config.downloader()));

  // ------------------------------------------------------------------
  // History
  // ------------------------------------------------------------------
  if (!config.history().disabled()) {
    if (config.history().path().empty()) {
      throw util::InvalidConfig("history.path must be set");
    }
    app.history = std::make_shared<exporter::ExportHistory>(config.history().path());
  }

  CARDPOSTER_LOG_INFO("application built", {StringField("cache_root", config.cache().root()),
                                            StringField("index", config.cache().has_memory() ? "memory" : "sqlite")});
  return app;
}

layout::PixelBudgets BudgetsFrom(const cardposter::runtime::config::RenderConfig& render) {
  layout::PixelBudgets budgets;
  if (render.page_pixel_budget_high() > 0) budgets.high = render.page_pixel_budget_high();
  if (render.page_pixel_budget_medium() > 0) budgets.medium = render.page_pixel_budget_medium();
  if (render.page_pixel_budget_low() > 0) budgets.low = render.page_pixel_budget_low();
  return budgets;
}

layout::SizeEstimate EstimateExport(const RuntimeConfig& config, const std::vector<cardposter::v1::CardRef>& cards,
                                    const cardposter::v1::ExportConfig& export_config) {
  const auto budgets  = BudgetsFrom(config.render());
  const auto filtered = layout::LayoutEngine::FilterAndSort(cards, export_config);
  layout::LayoutEngine::Validate(export_config, budgets, config.render().max_cards(), filtered.size());
  return layout::LayoutEngine::Estimate(filtered, export_config, layout::ProfileFor(export_config.quality(), budgets));
}

exporter::JobContext BuildJobContext(const Application& app, const RuntimeConfig& config) {
  const auto& render = config.render();

  exporter::JobContext ctx;
  ctx.cache      = app.cache;
  ctx.downloader = app.downloader;
  ctx.history    = app.history;
  ctx.budgets    = BudgetsFrom(render);

  ctx.render.attribution  = render.attribution();
  ctx.render.fsync        = render.has_fsync() ? render.fsync() : true;
  ctx.download_workers    = config.downloader().workers();
  ctx.max_parallel_pages  = render.max_parallel_pages();
  ctx.max_cards           = render.max_cards();
  return ctx;
}

} // namespace cardposter::factory
