#include "export_history.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstddef>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace cardposter::exporter {

using cardposter::v1::ExportRecord;
using observability::IntField;
using observability::StringField;
using storage::common::Unwrap;

ExportHistory::ExportHistory(std::filesystem::path path) : path_(std::move(path)) {
}

void ExportHistory::Append(const ExportRecord& record) {
  std::string line;
  auto        status = google::protobuf::util::MessageToJsonString(record, &line);
  if (!status.ok()) {
    throw util::StorageError("export record not serializable: " + status.ToString());
  }
  line += '\n';

  std::scoped_lock lock(mutex_);
  try {
    const auto parent = path_.parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    auto out = Unwrap(arrow::io::FileOutputStream::Open(path_.string(), /*append=*/true));
    Unwrap(out->Write(line.data(), static_cast<int64_t>(line.size())));
    Unwrap(out->Close());
  } catch (const std::exception& e) {
    throw util::StorageError("export history append failed (" + path_.string() + "): " + e.what());
  }
}

std::vector<ExportRecord> ExportHistory::List(size_t limit) const {
  std::scoped_lock lock(mutex_);

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) return {};

  std::string contents;
  try {
    auto file   = Unwrap(arrow::io::ReadableFile::Open(path_.string()));
    auto buffer = storage::common::ReadAll(file);
    contents    = buffer->ToString();
  } catch (const std::exception& e) {
    throw util::StorageError("export history unreadable (" + path_.string() + "): " + e.what());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  std::vector<ExportRecord> records;
  size_t                    line_no = 0;
  size_t                    start   = 0;
  while (start < contents.size()) {
    auto end = contents.find('\n', start);
    if (end == std::string::npos) end = contents.size();
    const auto line = contents.substr(start, end - start);
    start           = end + 1;
    line_no++;
    if (line.empty()) continue;

    ExportRecord record;
    auto         status = google::protobuf::util::JsonStringToMessage(line, &record, options);
    if (!status.ok()) {
      CARDPOSTER_LOG_WARN("skipping unreadable export history line",
                          {StringField("path", path_.string()), IntField("line", static_cast<int64_t>(line_no))});
      continue;
    }
    records.push_back(std::move(record));
  }

  if (limit > 0 && records.size() > limit) {
    records.erase(records.begin(), records.end() - static_cast<std::ptrdiff_t>(limit));
  }
  return records;
}

ExportRecord MakeExportRecord(const ExportResult& result, const cardposter::v1::ExportConfig& config, util::TimePoint exported_at) {
  ExportRecord record;
  record.set_exported_at(util::FormatIso8601(exported_at));
  record.set_title(config.title());
  record.set_outcome(ExportOutcomeName(result.outcome));
  record.set_format(config.format());
  record.set_quality(config.quality());
  record.set_manifest_path(result.manifest_path);
  record.set_csv_path(result.csv_path);
  record.set_pages(static_cast<uint32_t>(result.pages.size()));
  record.set_elapsed_ms(static_cast<uint64_t>(result.elapsed.count()));

  uint64_t total_bytes = 0;
  for (const auto& path : result.artifacts) {
    record.add_artifacts(path);
    std::error_code ec;
    const auto      size = std::filesystem::file_size(path, ec);
    if (!ec) total_bytes += size;
  }
  record.set_total_bytes(total_bytes);

  auto* counts = record.mutable_counts();
  counts->set_total(result.counts.total);
  counts->set_succeeded(result.counts.succeeded);
  counts->set_from_cache(result.counts.from_cache);
  counts->set_from_network(result.counts.from_network);
  counts->set_placeholder(result.counts.placeholder);
  counts->set_failed(result.counts.failed);
  counts->set_cancelled(result.counts.cancelled);
  return record;
}

} // namespace cardposter::exporter
