#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <vector>

#include "cardposter/v1.hpp"
#include "internal/export/export_result.hpp"
#include "internal/util/time.hpp"

namespace cardposter::exporter {

/*
  Append-only export history: one ExportRecord per line, as JSON.

  Lines are only ever appended; nothing rewrites or truncates the file.
  Shared by every coordinator of the process.
*/
class ExportHistory {
 public:
  explicit ExportHistory(std::filesystem::path path);

  // Throws util::StorageError when the line cannot be appended.
  void Append(const cardposter::v1::ExportRecord& record);

  // Oldest first. limit > 0 keeps the newest `limit` records. A missing
  // file is an empty history; lines that do not parse are skipped.
  std::vector<cardposter::v1::ExportRecord> List(size_t limit = 0) const;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  mutable std::mutex    mutex_;
};

cardposter::v1::ExportRecord MakeExportRecord(const ExportResult& result, const cardposter::v1::ExportConfig& config,
                                              util::TimePoint exported_at);

} // namespace cardposter::exporter
