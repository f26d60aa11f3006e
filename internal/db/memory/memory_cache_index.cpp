#include "memory_cache_index.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace cardposter::db::memory {

MemoryCacheIndex::MemoryCacheIndex() = default;

std::unique_ptr<db::Transaction> MemoryCacheIndex::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::CacheEntryRecord> MemoryCacheIndex::Get(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.entries.find(key);
  if (it == s.entries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CacheEntryRecord> MemoryCacheIndex::List(Transaction& t) {
  const auto&                          s = TX(t).View();
  std::vector<model::CacheEntryRecord> records;
  records.reserve(s.entries.size());
  for (const auto& [_, record] : s.entries) {
    records.push_back(record);
  }
  // same order as the sqlite index
  std::stable_sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    return a.last_accessed_ms < b.last_accessed_ms;
  });
  return records;
}

Result MemoryCacheIndex::Upsert(Transaction& t, const model::CacheEntryRecord& r) {
  TX(t).Mutable().entries[r.key] = r;
  return Result::Ok();
}

Result MemoryCacheIndex::Touch(Transaction& t, const std::string& key, uint64_t accessed_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(key);
  if (it == s.entries.end()) return Result::Err(ErrorCode::NotFound, key);
  it->second.last_accessed_ms = accessed_at_ms;
  it->second.access_count++;
  return Result::Ok();
}

Result MemoryCacheIndex::SetStatus(Transaction& t, const std::string& key, model::CacheStatus status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(key);
  if (it == s.entries.end()) return Result::Err(ErrorCode::NotFound, key);
  it->second.status = status;
  return Result::Ok();
}

Result MemoryCacheIndex::Delete(Transaction& t, const std::string& key) {
  TX(t).Mutable().entries.erase(key);
  return Result::Ok();
}

} // namespace cardposter::db::memory
