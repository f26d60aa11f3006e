#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "cardposter/v1.hpp"
#include "internal/export/export_result.hpp"
#include "internal/export/job_context.hpp"
#include "internal/runtime/cancellation.hpp"

namespace cardposter::exporter {

/*
  Drives one export job end to end.

    Idle → Planning → Resolving → Rendering → Completed
                  ↘          ↘           ↘
                          Cancelled

  Cards are resolved on a per-job download pool; each page goes to a
  render pool as soon as its last card is in. Workers only report back
  through a completion queue; counts, page state and progress callbacks
  are all handled on the thread that called Run().

  One job at a time per coordinator. Cancel() may be called from any
  thread, including from inside the progress callback.
*/
class ExportCoordinator {
 public:
  using ProgressCallback = std::function<void(const ProgressUpdate&)>;

  explicit ExportCoordinator(JobContext context);

  // Throws util::InvalidConfig before Planning. Every other failure is
  // reported through the result. Every job that returns is appended to
  // the context's history when it has one.
  ExportResult Run(const std::vector<cardposter::v1::CardRef>& cards, const cardposter::v1::ExportConfig& config,
                   ProgressCallback progress = {});

  // Cancels the running job; no effect when idle.
  void Cancel();

  JobState State() const {
    return state_.load();
  }

 private:
  ExportResult RunJob(const std::vector<cardposter::v1::CardRef>& cards, const cardposter::v1::ExportConfig& config,
                      const ProgressCallback& progress);

  void Transition(JobState next, ProgressUpdate& progress, const ProgressCallback& callback);

  std::shared_ptr<runtime::CancellationToken> BeginJob();

  JobContext            context_;
  std::atomic<JobState> state_{JobState::kIdle};

  std::mutex                                  token_mutex_;
  std::shared_ptr<runtime::CancellationToken> token_;
};

} // namespace cardposter::exporter
