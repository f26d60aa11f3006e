#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/cache_key.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/export/export_coordinator.hpp"
#include "internal/export/export_history.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using cardposter::config::ConfigLoader;
using cardposter::exporter::ExportCoordinator;
using cardposter::exporter::ExportOutcome;
using cardposter::observability::StringField;

static volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
  g_interrupted = 1;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  card-poster <config.yaml> export <cards> <export-config> [output_dir]\n"
            << "  card-poster <config.yaml> estimate <cards> <export-config>\n"
            << "  card-poster <config.yaml> export-history [limit=20]\n"
            << "  card-poster <config.yaml> cache-stats\n"
            << "  card-poster <config.yaml> cache-cleanup [days=30]\n"
            << "  card-poster <config.yaml> cache-clear\n"
            << "  card-poster <config.yaml> cache-invalidate <url>\n";
}

static std::vector<cardposter::v1::CardRef> LoadCards(const std::string& path) {
  auto list = ConfigLoader::LoadCardList(path);
  return {list.cards().begin(), list.cards().end()};
}

static int ExitCodeFor(ExportOutcome outcome) {
  switch (outcome) {
    case ExportOutcome::kExported:
      return 0;
    case ExportOutcome::kExportedWithPlaceholders:
      return 3;
    case ExportOutcome::kNothingToExport:
      return 4;
    case ExportOutcome::kCancelled:
      return 5;
    case ExportOutcome::kFailedToWrite:
    case ExportOutcome::kFailed:
      return 2;
  }
  return 2;
}

static int RunExport(const cardposter::runtime::config::RuntimeConfig& config, int argc, char** argv) {
  if (argc < 5) {
    Usage();
    return 1;
  }

  auto cards         = LoadCards(argv[3]);
  auto export_config = ConfigLoader::LoadExportConfig(argv[4]);
  if (argc >= 6) export_config.set_output_dir(argv[5]);

  auto              app = cardposter::factory::Build(config);
  ExportCoordinator coordinator(cardposter::factory::BuildJobContext(app, config));

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  // signal handlers may only touch the flag; this thread forwards it
  std::atomic<bool> done{false};
  std::thread       watcher([&] {
    while (!done.load()) {
      if (g_interrupted) {
        coordinator.Cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  cardposter::exporter::ExportResult result;
  try {
    result = coordinator.Run(cards, export_config, [](const cardposter::exporter::ProgressUpdate& p) {
      std::cout << "\r[" << cardposter::exporter::JobStateName(p.state) << "] " << p.processed << "/" << p.total
                << " cards (cache " << p.from_cache << ", network " << p.from_network << ", placeholder " << p.placeholder
                << ") pages " << p.pages_done << "/" << p.pages_total << std::flush;
    });
  } catch (...) {
    done.store(true);
    watcher.join();
    throw;
  }
  done.store(true);
  watcher.join();
  std::cout << "\n";

  std::cout << "outcome: " << cardposter::exporter::ExportOutcomeName(result.outcome) << "\n"
            << "cards: " << result.counts.total << " succeeded=" << result.counts.succeeded << " cache=" << result.counts.from_cache
            << " network=" << result.counts.from_network << " placeholder=" << result.counts.placeholder
            << " failed=" << result.counts.failed << " cancelled=" << result.counts.cancelled << "\n"
            << "elapsed: " << result.elapsed.count() << " ms\n";
  for (const auto& path : result.artifacts) std::cout << "wrote " << path << "\n";
  for (const auto& path : result.discarded) std::cout << "discarded " << path << "\n";
  for (const auto& page : result.pages) {
    if (!page.written && !page.error.empty()) std::cout << "page " << page.page_index + 1 << " failed: " << page.error << "\n";
  }
  for (const auto& card : result.cards) {
    if (!card.failure_reason.empty()) std::cout << "placeholder " << card.card_id << " (" << card.name << "): " << card.failure_reason << "\n";
  }
  if (!result.manifest_path.empty()) std::cout << "manifest " << result.manifest_path << "\n";
  if (!result.csv_path.empty()) std::cout << "card list " << result.csv_path << "\n";
  if (!result.message.empty()) std::cout << result.message << "\n";

  return ExitCodeFor(result.outcome);
}

static int RunEstimate(const cardposter::runtime::config::RuntimeConfig& config, int argc, char** argv) {
  if (argc < 5) {
    Usage();
    return 1;
  }

  auto cards         = LoadCards(argv[3]);
  auto export_config = ConfigLoader::LoadExportConfig(argv[4]);

  auto estimate = cardposter::factory::EstimateExport(config, cards, export_config);

  std::cout << "cards: " << estimate.card_count << "\n"
            << "pages: " << estimate.pages << " (" << estimate.cells_per_page << " cells per page)\n";
  for (size_t i = 0; i < estimate.page_dimensions.size(); ++i) {
    std::cout << "  page " << i + 1 << ": " << estimate.page_dimensions[i].width << "x" << estimate.page_dimensions[i].height << "\n";
  }
  std::cout << "raw size: " << std::fixed << std::setprecision(1) << estimate.raw_megabytes << " MB\n";
  for (const auto& warning : estimate.warnings) std::cout << "warning: " << warning << "\n";
  return 0;
}

static int RunHistory(const cardposter::runtime::config::RuntimeConfig& config, int argc, char** argv) {
  if (config.history().disabled()) {
    std::cerr << "export history is disabled\n";
    return 1;
  }
  int limit = 20;
  if (argc >= 4) limit = std::stoi(argv[3]);
  if (limit < 0) {
    std::cerr << "limit must be >= 0\n";
    return 1;
  }

  cardposter::exporter::ExportHistory history(config.history().path());
  const auto                          records = history.List(static_cast<size_t>(limit));
  if (records.empty()) {
    std::cout << "no exports recorded\n";
    return 0;
  }
  for (const auto& record : records) {
    std::cout << record.exported_at() << "  " << record.outcome() << "  \"" << record.title() << "\"  "
              << cardposter::v1::OutputFormat_Name(record.format()) << "  pages=" << record.pages()
              << " cards=" << record.counts().total() << " placeholder=" << record.counts().placeholder()
              << " bytes=" << record.total_bytes() << "\n";
    for (const auto& path : record.artifacts()) std::cout << "    " << path << "\n";
    if (!record.csv_path().empty()) std::cout << "    " << record.csv_path() << "\n";
  }
  return 0;
}

static int RunCacheCommand(const cardposter::runtime::config::RuntimeConfig& config, const std::string& command, int argc,
                           char** argv) {
  auto  app   = cardposter::factory::Build(config);
  auto& cache = *app.cache;

  if (command == "cache-stats") {
    auto stats = cache.Stats();
    std::cout << "active_entries=" << stats.active_entries << "\n"
              << "stale_entries=" << stats.stale_entries << "\n"
              << "evicted_entries=" << stats.evicted_entries << "\n"
              << "active_bytes=" << stats.active_bytes << "\n";
    return 0;
  }

  if (command == "cache-cleanup") {
    int days = 30;
    if (argc >= 4) days = std::stoi(argv[3]);
    if (days < 0) {
      std::cerr << "days must be >= 0\n";
      return 1;
    }
    auto cutoff = cardposter::util::Now() - std::chrono::hours(24) * days;
    auto report = cache.EvictOlderThan(cutoff);
    std::cout << "evicted " << report.entries << " entries, freed " << report.bytes_freed << " bytes\n";
    return 0;
  }

  if (command == "cache-clear") {
    cache.Clear();
    std::cout << "cache cleared\n";
    return 0;
  }

  if (command == "cache-invalidate") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    if (!cache.Invalidate(cardposter::cache::MakeCacheKey(argv[3]))) {
      std::cerr << "not cached: " << argv[3] << "\n";
      return 1;
    }
    std::cout << "invalidated " << argv[3] << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string command     = argv[2];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ConfigLoader::LoadFromYaml(config_path);
    cardposter::observability::InitializeLogging(config);

    int rc = 1;
    if (command == "export") {
      rc = RunExport(config, argc, argv);
    } else if (command == "estimate") {
      rc = RunEstimate(config, argc, argv);
    } else if (command == "export-history") {
      rc = RunHistory(config, argc, argv);
    } else if (command.rfind("cache-", 0) == 0) {
      rc = RunCacheCommand(config, command, argc, argv);
    } else {
      Usage();
    }

    cardposter::observability::ShutdownLogging();
    return rc;
  } catch (const cardposter::util::InvalidConfig& e) {
    std::cerr << "invalid configuration: " << e.what() << std::endl;
    cardposter::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    CARDPOSTER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    cardposter::observability::ShutdownLogging();
    return 2;
  }
}
