#include "export_coordinator.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <system_error>

#include "internal/export/card_csv.hpp"
#include "internal/layout/layout_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/blocking_queue.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace cardposter::exporter {

using namespace cardposter::v1;
using download::ResolvedImage;
using observability::IntField;
using observability::StringField;

namespace {

/*
  Worker → coordinator message. One per resolved card, one per finished
  page render.
*/
struct Event {
  enum class Kind { kResolved, kResolveFailed, kRendered };

  Kind   kind = Kind::kResolved;
  size_t page = 0;
  size_t cell = 0;

  // kResolved
  ResolvedImage image;
  bool          skipped = false; // never started: job already cancelled

  // kRendered
  bool        render_skipped = false;
  std::string path;
  int         width            = 0;
  int         height           = 0;
  uint32_t    decode_fallbacks = 0;

  // kResolveFailed / kRendered
  std::string error;
};

ProgressUpdate Snapshot(JobState state, const ExportCounts& counts, uint32_t pages_done, uint32_t pages_total) {
  ProgressUpdate update;
  update.state        = state;
  update.processed    = counts.processed;
  update.total        = counts.total;
  update.from_cache   = counts.from_cache;
  update.from_network = counts.from_network;
  update.placeholder  = counts.placeholder;
  update.pages_done   = pages_done;
  update.pages_total  = pages_total;
  return update;
}

void Notify(const ExportCoordinator::ProgressCallback& callback, const ProgressUpdate& update) {
  if (!callback) return;
  try {
    callback(update);
  } catch (const std::exception& e) {
    CARDPOSTER_LOG_WARN("progress callback threw", {StringField("error", e.what())});
  }
}

void DiscardArtifacts(ExportResult& result) {
  for (auto& page : result.pages) {
    if (!page.written) continue;
    std::error_code ec;
    std::filesystem::remove(page.path, ec);
    if (ec) {
      CARDPOSTER_LOG_WARN("could not delete page artifact", {StringField("path", page.path), StringField("error", ec.message())});
    }
    page.written   = false;
    page.discarded = true;
    result.discarded.push_back(page.path);
  }
  result.artifacts.clear();
}

ExportManifest BuildManifest(const ExportResult& result, const std::vector<layout::PagePlan>& pages, const std::vector<CardRef>& cards,
                             const ExportConfig& config, util::TimePoint export_time) {
  ExportManifest manifest;
  manifest.set_title(config.title());
  manifest.set_exported_at(util::FormatIso8601(export_time));
  *manifest.mutable_config() = config;

  auto* counts = manifest.mutable_counts();
  counts->set_total(result.counts.total);
  counts->set_succeeded(result.counts.succeeded);
  counts->set_from_cache(result.counts.from_cache);
  counts->set_from_network(result.counts.from_network);
  counts->set_placeholder(result.counts.placeholder);
  counts->set_failed(result.counts.failed);
  counts->set_cancelled(result.counts.cancelled);

  size_t card_index = 0;
  for (size_t p = 0; p < pages.size(); ++p) {
    const auto& report = result.pages[p];
    auto*       page   = manifest.add_pages();
    page->set_page_index(report.page_index);
    page->set_path(std::filesystem::path(report.path).filename().string());
    page->set_written(report.written);
    page->set_error(report.error);
    page->set_width(static_cast<uint32_t>(report.width));
    page->set_height(static_cast<uint32_t>(report.height));
    for (size_t i = 0; i < pages[p].cells.size(); ++i, ++card_index) {
      const auto& outcome = result.cards[card_index];
      auto*       card    = page->add_cards();
      card->set_card_id(outcome.card_id);
      card->set_name(outcome.name);
      card->set_row(outcome.row);
      card->set_column(outcome.column);
      card->set_origin(outcome.origin);
      card->set_failure_reason(outcome.failure_reason);
    }
  }

  for (const auto& card : cards) {
    *manifest.add_cards() = card;
  }
  manifest.set_elapsed_ms(static_cast<uint64_t>(result.elapsed.count()));
  return manifest;
}

void WriteTextFile(const std::filesystem::path& path, const std::string& text, bool fsync) {
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
  storage::common::WriteFileAtomic(path, reinterpret_cast<const uint8_t*>(text.data()), static_cast<int64_t>(text.size()), fsync);
}

} // namespace

const char* JobStateName(JobState state) {
  switch (state) {
    case JobState::kIdle:
      return "idle";
    case JobState::kPlanning:
      return "planning";
    case JobState::kResolving:
      return "resolving";
    case JobState::kRendering:
      return "rendering";
    case JobState::kCompleted:
      return "completed";
    case JobState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

const char* ExportOutcomeName(ExportOutcome outcome) {
  switch (outcome) {
    case ExportOutcome::kExported:
      return "exported";
    case ExportOutcome::kExportedWithPlaceholders:
      return "exported_with_placeholders";
    case ExportOutcome::kFailedToWrite:
      return "failed_to_write";
    case ExportOutcome::kFailed:
      return "failed";
    case ExportOutcome::kNothingToExport:
      return "nothing_to_export";
    case ExportOutcome::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

ExportCoordinator::ExportCoordinator(JobContext context) : context_(std::move(context)) {
  if (!context_.cache || !context_.downloader) {
    throw std::invalid_argument("export coordinator requires a cache store and a downloader");
  }
  if (!context_.clock) {
    context_.clock = util::Now;
  }
}

std::shared_ptr<runtime::CancellationToken> ExportCoordinator::BeginJob() {
  std::scoped_lock lock(token_mutex_);
  token_ = std::make_shared<runtime::CancellationToken>();
  return token_;
}

void ExportCoordinator::Cancel() {
  std::shared_ptr<runtime::CancellationToken> token;
  {
    std::scoped_lock lock(token_mutex_);
    token = token_;
  }
  if (token) {
    token->Cancel();
    CARDPOSTER_LOG_INFO("export cancellation requested");
  }
}

void ExportCoordinator::Transition(JobState next, ProgressUpdate& progress, const ProgressCallback& callback) {
  const auto previous = state_.exchange(next);
  if (!CanTransition(previous, next)) {
    throw std::logic_error(std::string("invalid export state transition ") + JobStateName(previous) + " -> " + JobStateName(next));
  }
  CARDPOSTER_LOG_INFO("export state", {StringField("from", JobStateName(previous)), StringField("to", JobStateName(next))});
  progress.state = next;
  Notify(callback, progress);
}

ExportResult ExportCoordinator::Run(const std::vector<CardRef>& cards, const ExportConfig& config, ProgressCallback progress) {
  auto result = RunJob(cards, config, progress);
  if (!context_.history) return result;

  try {
    context_.history->Append(MakeExportRecord(result, config, context_.clock()));
  } catch (const util::StorageError& e) {
    CARDPOSTER_LOG_WARN("export not recorded in history", {StringField("error", e.what())});
    result.message += "; not recorded in history: " + std::string(e.what());
  }
  return result;
}

ExportResult ExportCoordinator::RunJob(const std::vector<CardRef>& cards, const ExportConfig& config, const ProgressCallback& progress) {
  const auto started = std::chrono::steady_clock::now();
  auto       elapsed = [&started] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  };

  state_ = JobState::kIdle;

  // Idle: configuration errors surface before any work starts
  const auto filtered = layout::LayoutEngine::FilterAndSort(cards, config);
  layout::LayoutEngine::Validate(config, context_.budgets, context_.max_cards, filtered.size());
  const auto profile = layout::ProfileFor(config.quality(), context_.budgets);

  auto token = BeginJob();

  ExportResult result;
  result.counts.total = static_cast<uint32_t>(filtered.size());

  ProgressUpdate update = Snapshot(JobState::kIdle, result.counts, 0, 0);
  Transition(JobState::kPlanning, update, progress);

  const auto pages = layout::LayoutEngine::Plan(filtered, config, profile);
  if (token->IsCancelled()) {
    Transition(JobState::kCancelled, update, progress);
    result.outcome     = ExportOutcome::kCancelled;
    result.final_state = JobState::kCancelled;
    result.elapsed     = elapsed();
    result.message     = "export cancelled before any card was resolved";
    return result;
  }
  if (pages.empty()) {
    Transition(JobState::kCompleted, update, progress);
    result.outcome     = ExportOutcome::kNothingToExport;
    result.final_state = JobState::kCompleted;
    result.elapsed     = elapsed();
    result.message     = "no cards match the export filter";
    return result;
  }

  const auto export_time = context_.clock();
  const auto stem        = layout::LayoutEngine::ArtifactStem(config);
  const auto output_dir  = std::filesystem::path(config.output_dir());
  const auto pages_total = static_cast<uint32_t>(pages.size());

  CARDPOSTER_LOG_INFO("export planned", {IntField("cards", result.counts.total), IntField("pages", pages_total),
                                         StringField("quality", QualityTier_Name(config.quality())), StringField("stem", stem)});

  // Per-page bookkeeping; touched only on this thread.
  std::vector<std::vector<ResolvedImage>> images(pages.size());
  std::vector<size_t>                     remaining(pages.size());
  result.pages.resize(pages.size());
  for (size_t p = 0; p < pages.size(); ++p) {
    images[p].resize(pages[p].cells.size());
    remaining[p]                  = pages[p].cells.size();
    result.pages[p].page_index    = pages[p].page_index;
    result.pages[p].card_count    = static_cast<uint32_t>(pages[p].cells.size());
    result.pages[p].path          = (output_dir / render::Compositor::PageFileName(stem, pages[p].page_index, config.format())).string();
    for (const auto& cell : pages[p].cells) {
      CardOutcome outcome;
      outcome.card_id    = cell.card.id();
      outcome.name       = cell.card.name();
      outcome.page_index = pages[p].page_index;
      outcome.row        = cell.row;
      outcome.column     = cell.column;
      result.cards.push_back(std::move(outcome));
    }
  }
  std::vector<size_t> first_card(pages.size(), 0);
  for (size_t p = 1; p < pages.size(); ++p) {
    first_card[p] = first_card[p - 1] + pages[p - 1].cells.size();
  }

  const render::Compositor compositor(context_.render);
  const bool               cache_opt_out = config.cache_opt_out();

  runtime::BlockingQueue<Event> events;
  // pools are declared last so they join before anything they reference goes away
  runtime::WorkerPool downloads("download", context_.download_workers);
  runtime::WorkerPool renders("render", context_.max_parallel_pages);

  Transition(JobState::kResolving, update, progress);

  bool        job_failed = false;
  std::string failure;
  size_t      outstanding_cards = 0;
  size_t      rendering         = 0;
  uint32_t    pages_done        = 0;

  // Pages are dispatched in plan order and at most `window` pages past the
  // oldest page that is not finished, so the encoded images held at once stay
  // bounded whatever the collection size.
  const size_t      window      = static_cast<size_t>(std::max<uint32_t>(context_.max_parallel_pages, 1)) + 1;
  size_t            next_page   = 0;
  size_t            oldest_open = 0;
  size_t            resident    = 0;
  std::vector<bool> finished(pages.size(), false);

  auto dispatch_page = [&](size_t p) {
    for (size_t i = 0; i < pages[p].cells.size(); ++i) {
      const bool queued = downloads.Submit([&, p, i, token] {
        Event ev;
        ev.page = p;
        ev.cell = i;
        if (token->IsCancelled()) {
          ev.skipped = true;
          events.Push(std::move(ev));
          return;
        }
        try {
          ev.image = context_.downloader->Resolve(pages[p].cells[i].card, cache_opt_out, token.get());
        } catch (const std::exception& e) {
          ev.kind  = Event::Kind::kResolveFailed;
          ev.error = e.what();
        }
        events.Push(std::move(ev));
      });
      if (!queued) {
        throw std::runtime_error("download pool rejected a task");
      }
      outstanding_cards++;
    }
    resident += pages[p].cells.size();
    result.peak_resident_images = std::max(result.peak_resident_images, resident);
  };

  auto fill_window = [&] {
    while (next_page < pages.size() && next_page < oldest_open + window && !token->IsCancelled()) {
      dispatch_page(next_page++);
    }
  };

  auto finish_page = [&](size_t p) {
    finished[p] = true;
    resident -= pages[p].cells.size();
    while (oldest_open < pages.size() && finished[oldest_open]) {
      oldest_open++;
    }
  };

  auto submit_render = [&](size_t p) {
    auto page_images = std::make_shared<std::vector<ResolvedImage>>(std::move(images[p]));
    images[p].clear();
    const auto path   = result.pages[p].path;
    const bool queued = renders.Submit([&, p, page_images, path, token] {
      Event ev;
      ev.kind = Event::Kind::kRendered;
      ev.page = p;
      if (token->IsCancelled()) {
        ev.render_skipped = true;
        events.Push(std::move(ev));
        return;
      }
      try {
        const auto encoded = compositor.Render(pages[p], *page_images, config, profile, export_time);
        ev.width            = encoded.width;
        ev.height           = encoded.height;
        ev.decode_fallbacks = encoded.decode_fallbacks;
        ev.path             = compositor.WritePage(encoded, path).string();
      } catch (const std::exception& e) {
        ev.error = e.what();
      }
      events.Push(std::move(ev));
    });
    if (!queued) {
      throw std::runtime_error("render pool rejected a task");
    }
    rendering++;
  };

  fill_window();

  while (outstanding_cards > 0 || rendering > 0) {
    auto ev = events.Pop();
    if (!ev) break;

    switch (ev->kind) {
      case Event::Kind::kResolveFailed: {
        outstanding_cards--;
        remaining[ev->page]--;
        if (!job_failed) {
          job_failed = true;
          failure    = ev->error;
          CARDPOSTER_LOG_ERROR("cache failure, aborting export", {StringField("error", failure)});
          token->Cancel();
        }
        break;
      }
      case Event::Kind::kResolved: {
        outstanding_cards--;
        remaining[ev->page]--;
        // stopped by cancellation: neither processed nor a placeholder
        if (!ev->skipped && !ev->image.cancelled) {
          auto& outcome          = result.cards[first_card[ev->page] + ev->cell];
          outcome.origin         = ev->image.origin;
          outcome.attempts       = ev->image.attempts;
          outcome.failure_reason = ev->image.failure_reason;

          result.counts.processed++;
          switch (ev->image.origin) {
            case IMAGE_ORIGIN_CACHE:
              result.counts.from_cache++;
              break;
            case IMAGE_ORIGIN_NETWORK:
              result.counts.from_network++;
              break;
            default:
              result.counts.placeholder++;
              result.pages[ev->page].placeholders++;
              break;
          }
          images[ev->page][ev->cell] = std::move(ev->image);
          Notify(progress, Snapshot(state_.load(), result.counts, pages_done, pages_total));
        }

        if (remaining[ev->page] == 0 && !token->IsCancelled()) {
          submit_render(ev->page);
        }
        if (outstanding_cards == 0 && next_page == pages.size() && !token->IsCancelled()) {
          update = Snapshot(state_.load(), result.counts, pages_done, pages_total);
          Transition(JobState::kRendering, update, progress);
        }
        break;
      }
      case Event::Kind::kRendered: {
        rendering--;
        finish_page(ev->page);
        auto& report = result.pages[ev->page];
        if (ev->render_skipped) break;

        report.width  = ev->width;
        report.height = ev->height;
        if (ev->error.empty()) {
          report.written = true;
          result.artifacts.push_back(ev->path);
          // undecodable bytes were drawn as placeholders
          result.counts.placeholder += ev->decode_fallbacks;
          report.placeholders += ev->decode_fallbacks;
        } else {
          report.error = ev->error;
          CARDPOSTER_LOG_ERROR("page not written", {IntField("page", report.page_index), StringField("error", report.error)});
        }
        pages_done++;
        Notify(progress, Snapshot(state_.load(), result.counts, pages_done, pages_total));
        fill_window();
        break;
      }
    }
  }

  downloads.Stop();
  renders.Stop();

  result.elapsed = elapsed();

  if (job_failed) {
    DiscardArtifacts(result);
    update = Snapshot(state_.load(), result.counts, pages_done, pages_total);
    Transition(JobState::kCompleted, update, progress);
    result.outcome     = ExportOutcome::kFailed;
    result.final_state = JobState::kCompleted;
    result.message     = "export failed: " + failure;
    return result;
  }

  if (token->IsCancelled()) {
    DiscardArtifacts(result);
    update = Snapshot(state_.load(), result.counts, pages_done, pages_total);
    Transition(JobState::kCancelled, update, progress);
    result.counts.cancelled = result.counts.total - result.counts.processed;
    result.outcome          = ExportOutcome::kCancelled;
    result.final_state      = JobState::kCancelled;
    result.message          = "export cancelled after " + std::to_string(result.counts.processed) + " of " +
                     std::to_string(result.counts.total) + " cards; " + std::to_string(result.discarded.size()) +
                     " written page(s) discarded";
    return result;
  }

  // cards on unwritten pages count as failed, not as succeeded or placeholder
  uint32_t failed_pages = 0;
  for (const auto& report : result.pages) {
    if (report.written) continue;
    failed_pages++;
    result.counts.failed += report.card_count;
    result.counts.placeholder -= report.placeholders;
  }
  result.counts.succeeded = result.counts.total - result.counts.placeholder - result.counts.failed;

  if (failed_pages > 0) {
    result.outcome = ExportOutcome::kFailedToWrite;
    result.message = std::to_string(failed_pages) + " of " + std::to_string(pages_total) + " page(s) could not be written";
  } else if (result.counts.placeholder > 0) {
    result.outcome = ExportOutcome::kExportedWithPlaceholders;
    result.message = std::to_string(pages_total) + " page(s) written, " + std::to_string(result.counts.placeholder) +
                     " card(s) drawn as placeholders";
  } else {
    result.outcome = ExportOutcome::kExported;
    result.message = std::to_string(pages_total) + " page(s) written";
  }

  if (config.write_manifest()) {
    const auto manifest_path = output_dir / (stem + "_manifest.json");
    const auto manifest      = BuildManifest(result, pages, filtered, config, export_time);

    std::string                               json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    auto status            = google::protobuf::util::MessageToJsonString(manifest, &json, options);
    try {
      if (!status.ok()) throw std::runtime_error(status.ToString());
      WriteTextFile(manifest_path, json, context_.render.fsync);
      result.manifest_path = manifest_path.string();
    } catch (const std::exception& e) {
      CARDPOSTER_LOG_ERROR("manifest not written", {StringField("path", manifest_path.string()), StringField("error", e.what())});
      result.message += "; manifest not written: " + std::string(e.what());
    }
  }

  if (config.write_csv()) {
    const auto csv_path = output_dir / (stem + "_cards.csv");
    try {
      WriteTextFile(csv_path, BuildCardCsv(result, pages), context_.render.fsync);
      result.csv_path = csv_path.string();
    } catch (const std::exception& e) {
      CARDPOSTER_LOG_ERROR("card list not written", {StringField("path", csv_path.string()), StringField("error", e.what())});
      result.message += "; card list not written: " + std::string(e.what());
    }
  }

  update = Snapshot(state_.load(), result.counts, pages_done, pages_total);
  Transition(JobState::kCompleted, update, progress);
  result.final_state = JobState::kCompleted;

  CARDPOSTER_LOG_INFO("export finished", {StringField("outcome", ExportOutcomeName(result.outcome)),
                                          IntField("succeeded", result.counts.succeeded), IntField("placeholder", result.counts.placeholder),
                                          IntField("failed", result.counts.failed), IntField("elapsed_ms", result.elapsed.count())});
  return result;
}

} // namespace cardposter::exporter
