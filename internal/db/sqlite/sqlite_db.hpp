#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace cardposter::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The connection is opened in serialized (FULLMUTEX) mode; callers still
  need to serialize whole transactions themselves.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace cardposter::db::sqlite
