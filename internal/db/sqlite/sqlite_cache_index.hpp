#pragma once

#include <memory>

#include "internal/db/api/cache_index.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace cardposter::db::sqlite {

/*
  Durable cache index in a single sqlite table.
*/
class SqliteCacheIndex final : public db::CacheIndex {
 public:
  explicit SqliteCacheIndex(std::shared_ptr<SqliteDB> db);

  // Creates the schema if missing.
  static void Bootstrap(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::CacheEntryRecord> Get(Transaction&, const std::string& key) override;
  std::vector<model::CacheEntryRecord>   List(Transaction&) override;

  Result Upsert(Transaction&, const model::CacheEntryRecord&) override;
  Result Touch(Transaction&, const std::string& key, uint64_t accessed_at_ms) override;
  Result SetStatus(Transaction&, const std::string& key, model::CacheStatus status) override;
  Result Delete(Transaction&, const std::string& key) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace cardposter::db::sqlite
