#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/cache/cache_store.hpp"
#include "internal/db/api/cache_index.hpp"
#include "internal/download/downloader.hpp"
#include "internal/export/export_history.hpp"
#include "internal/export/job_context.hpp"
#include "internal/fetch/fetcher.hpp"
#include "internal/layout/layout_engine.hpp"
#include "internal/layout/quality_profile.hpp"
#include "internal/storage/blob_store.hpp"

namespace cardposter::factory {

/*
  Application

  Owns the long-lived pieces shared by every job of this process.
*/
struct Application {
  std::shared_ptr<db::CacheIndex>       index;
  storage::BlobStorePtr                 blobs;
  std::shared_ptr<cache::CacheStore>    cache;
  fetch::FetcherPtr                     fetcher;
  std::shared_ptr<download::Downloader> downloader;
  // null when history is disabled
  std::shared_ptr<exporter::ExportHistory> history;
};

/*
  Build

  Constructs cache, fetcher and downloader from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete index, blob store and
  fetcher types. Pass a fetcher to replace libcurl (tests).
*/
Application Build(const cardposter::runtime::config::RuntimeConfig& config, fetch::FetcherPtr fetcher = nullptr);

download::DownloaderOptions DownloaderOptionsFrom(const cardposter::runtime::config::DownloaderConfig& config);

// Configured page budgets; zero fields keep the built-in defaults.
layout::PixelBudgets BudgetsFrom(const cardposter::runtime::config::RenderConfig& render);

// Dry run of an export: the same validation and budgets as a job, no I/O.
// Throws util::InvalidConfig where Run would.
layout::SizeEstimate EstimateExport(const cardposter::runtime::config::RuntimeConfig& config,
                                    const std::vector<cardposter::v1::CardRef>& cards, const cardposter::v1::ExportConfig& export_config);

// Per-job context over the shared application pieces.
exporter::JobContext BuildJobContext(const Application& app, const cardposter::runtime::config::RuntimeConfig& config);

} // namespace cardposter::factory
