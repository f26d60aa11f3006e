#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace cardposter::db::sqlite {

/*
  Takes the write lock up front (BEGIN IMMEDIATE) so a lookup that ends up
  touching or expiring an entry never has to upgrade a read lock.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void  Commit() override;
  void  Rollback() override;
  State state() const override { return state_; }

private:
  std::shared_ptr<SqliteDB> db_;
  State                     state_ = State::kOpen;
};

} // namespace cardposter::db::sqlite
