#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "cardposter/v1.hpp"

namespace cardposter::exporter {

enum class JobState {
  kIdle = 0,
  kPlanning,
  kResolving,
  kRendering,
  kCompleted,
  kCancelled,
};

constexpr bool IsTerminal(JobState state) {
  return state == JobState::kCompleted || state == JobState::kCancelled;
}

// Forward one step at a time; Completed and Cancelled are reachable from any
// working state.
constexpr bool CanTransition(JobState from, JobState to) {
  if (IsTerminal(from) || from == to || to == JobState::kIdle) {
    return false;
  }
  if (IsTerminal(to)) {
    return from != JobState::kIdle;
  }
  return static_cast<int>(to) == static_cast<int>(from) + 1;
}

enum class ExportOutcome {
  kExported = 0,            // every page written, no placeholders
  kExportedWithPlaceholders,
  kFailedToWrite,           // one or more pages could not be written
  kFailed,                  // job-level failure (cache unusable)
  kNothingToExport,         // filter left no cards
  kCancelled,
};

const char* JobStateName(JobState state);
const char* ExportOutcomeName(ExportOutcome outcome);

struct ExportCounts {
  uint32_t total        = 0;
  uint32_t processed    = 0;
  uint32_t succeeded    = 0; // real image on a written page
  uint32_t from_cache   = 0;
  uint32_t from_network = 0;
  uint32_t placeholder  = 0;
  uint32_t failed       = 0; // on a page that could not be written
  uint32_t cancelled    = 0; // not resolved because the job was cancelled
};

struct ProgressUpdate {
  JobState state       = JobState::kIdle;
  uint32_t processed   = 0;
  uint32_t total       = 0;
  uint32_t from_cache  = 0;
  uint32_t from_network = 0;
  uint32_t placeholder = 0;
  uint32_t pages_done  = 0;
  uint32_t pages_total = 0;
};

struct CardOutcome {
  std::string                 card_id;
  std::string                 name;
  uint32_t                    page_index = 0;
  uint32_t                    row        = 0;
  uint32_t                    column     = 0;
  cardposter::v1::ImageOrigin origin     = cardposter::v1::IMAGE_ORIGIN_UNSPECIFIED;
  uint32_t                    attempts   = 0;
  std::string                 failure_reason;
};

struct PageReport {
  uint32_t    page_index = 0;
  std::string path;
  bool        written   = false;
  bool        discarded = false; // written, then deleted on cancel/failure
  std::string error;
  int         width       = 0;
  int         height      = 0;
  uint32_t    card_count  = 0;
  uint32_t    placeholders = 0;
};

/*
  Terminal result of one export job.

  artifacts lists pages that exist on disk when Run() returns; a
  cancelled or failed job leaves none and lists the deleted ones in
  discarded.
*/
struct ExportResult {
  ExportOutcome             outcome     = ExportOutcome::kFailed;
  JobState                  final_state = JobState::kIdle;
  std::vector<std::string>  artifacts;
  std::vector<std::string>  discarded;
  std::vector<PageReport>   pages;
  std::vector<CardOutcome>  cards;
  ExportCounts              counts;
  std::chrono::milliseconds elapsed{0};
  std::string               manifest_path;
  std::string               csv_path;
  std::string               message;
  // most card images held by dispatched, unfinished pages at any one time
  size_t peak_resident_images = 0;
};

} // namespace cardposter::exporter
