#include "sqlite_cache_index.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace cardposter::db::sqlite {

using cardposter::db::ErrorCode;
using cardposter::db::Result;
using cardposter::db::model::CacheEntryRecord;
using cardposter::db::model::CacheStatus;

namespace {

constexpr const char* kSelectColumns =
    "SELECT key,source_url,blob_ref,content_hash,size_bytes,fetched_at_ms,last_accessed_ms,access_count,version,status "
    "FROM cache_entries";

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

CacheEntryRecord ReadRow(sqlite3_stmt* st) {
  CacheEntryRecord r;
  r.key              = ColText(st, 0);
  r.source_url       = ColText(st, 1);
  r.blob_ref         = ColText(st, 2);
  r.content_hash     = ColText(st, 3);
  r.size_bytes       = ColU64(st, 4);
  r.fetched_at_ms    = ColU64(st, 5);
  r.last_accessed_ms = ColU64(st, 6);
  r.access_count     = ColU64(st, 7);
  r.version          = ColU64(st, 8);
  r.status           = static_cast<CacheStatus>(sqlite3_column_int(st, 9));
  return r;
}

} // namespace

SqliteCacheIndex::SqliteCacheIndex(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteCacheIndex::Bootstrap(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS cache_entries ("
      "key TEXT PRIMARY KEY, "
      "source_url TEXT NOT NULL, "
      "blob_ref TEXT NOT NULL, "
      "content_hash TEXT NOT NULL, "
      "size_bytes INTEGER NOT NULL, "
      "fetched_at_ms INTEGER NOT NULL, "
      "last_accessed_ms INTEGER NOT NULL, "
      "access_count INTEGER NOT NULL DEFAULT 0, "
      "version INTEGER NOT NULL DEFAULT 1, "
      "status INTEGER NOT NULL DEFAULT 0);");
  db.Exec("CREATE INDEX IF NOT EXISTS idx_cache_entries_access ON cache_entries(status, last_accessed_ms);");
}

std::unique_ptr<db::Transaction> SqliteCacheIndex::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteCacheIndex::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteCacheIndex::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_FULL:
      return Result::Err(ErrorCode::Full, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::optional<CacheEntryRecord> SqliteCacheIndex::Get(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(kSelectColumns) + " WHERE key=?;";

  Statement s;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
    throw std::runtime_error(sqlite3_errmsg(db));

  BindText(s.st, 1, key);

  const int rc = sqlite3_step(s.st);
  if (rc == SQLITE_DONE)
    return std::nullopt;
  if (rc != SQLITE_ROW)
    throw std::runtime_error(sqlite3_errmsg(db));

  return ReadRow(s.st);
}

std::vector<CacheEntryRecord> SqliteCacheIndex::List(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(kSelectColumns) + " ORDER BY last_accessed_ms ASC, key ASC;";

  std::vector<CacheEntryRecord> out;
  Statement                     s;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
    throw std::runtime_error(sqlite3_errmsg(db));

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    out.push_back(ReadRow(s.st));
  }
  if (rc != SQLITE_DONE)
    throw std::runtime_error(sqlite3_errmsg(db));
  return out;
}

Result SqliteCacheIndex::Upsert(Transaction& t, const CacheEntryRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO cache_entries(key,source_url,blob_ref,content_hash,size_bytes,fetched_at_ms,last_accessed_ms,access_count,version,status) "
      "VALUES(?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(key) DO UPDATE SET source_url=excluded.source_url, blob_ref=excluded.blob_ref, "
      "content_hash=excluded.content_hash, size_bytes=excluded.size_bytes, fetched_at_ms=excluded.fetched_at_ms, "
      "last_accessed_ms=excluded.last_accessed_ms, access_count=excluded.access_count, version=excluded.version, "
      "status=excluded.status;";

  Statement s;
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(s.st, 1, r.key);
  BindText(s.st, 2, r.source_url);
  BindText(s.st, 3, r.blob_ref);
  BindText(s.st, 4, r.content_hash);
  BindU64(s.st, 5, r.size_bytes);
  BindU64(s.st, 6, r.fetched_at_ms);
  BindU64(s.st, 7, r.last_accessed_ms);
  BindU64(s.st, 8, r.access_count);
  BindU64(s.st, 9, r.version);
  BindI32(s.st, 10, static_cast<int>(r.status));

  return Translate(db, sqlite3_step(s.st));
}

Result SqliteCacheIndex::Touch(Transaction& t, const std::string& key, uint64_t accessed_at_ms) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE cache_entries SET last_accessed_ms=?, access_count=access_count+1 WHERE key=?;";

  Statement s;
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(s.st, 1, accessed_at_ms);
  BindText(s.st, 2, key);

  auto result = Translate(db, sqlite3_step(s.st));
  if (result && sqlite3_changes(db) == 0)
    return Result::Err(ErrorCode::NotFound, key);
  return result;
}

Result SqliteCacheIndex::SetStatus(Transaction& t, const std::string& key, CacheStatus status) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE cache_entries SET status=? WHERE key=?;";

  Statement s;
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(s.st, 1, static_cast<int>(status));
  BindText(s.st, 2, key);

  auto result = Translate(db, sqlite3_step(s.st));
  if (result && sqlite3_changes(db) == 0)
    return Result::Err(ErrorCode::NotFound, key);
  return result;
}

Result SqliteCacheIndex::Delete(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();

  const char* sql = "DELETE FROM cache_entries WHERE key=?;";

  Statement s;
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(s.st, 1, key);
  return Translate(db, sqlite3_step(s.st));
}

} // namespace cardposter::db::sqlite
