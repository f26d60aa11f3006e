#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "internal/cache/cache_store.hpp"
#include "internal/download/downloader.hpp"
#include "internal/export/export_history.hpp"
#include "internal/layout/quality_profile.hpp"
#include "internal/render/compositor.hpp"
#include "internal/util/time.hpp"

namespace cardposter::exporter {

/*
  Everything one export job needs, built explicitly by the factory.
  There is no process-wide state: two contexts never share anything
  except what the caller hands to both.
*/
struct JobContext {
  std::shared_ptr<cache::CacheStore>    cache;
  std::shared_ptr<download::Downloader> downloader;

  layout::PixelBudgets  budgets;
  render::RenderOptions render;

  uint32_t download_workers   = 8;
  uint32_t max_parallel_pages = 2;
  uint32_t max_cards          = 1000;

  // null = jobs are not recorded
  std::shared_ptr<ExportHistory> history;

  // export timestamp source (footer, manifest)
  std::function<util::TimePoint()> clock = util::Now;
};

} // namespace cardposter::exporter
