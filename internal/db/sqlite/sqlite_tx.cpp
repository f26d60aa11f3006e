#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace cardposter::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    CARDPOSTER_LOG_WARN("cache index rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) throw std::logic_error("cache index transaction already finished");
  db_->Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace cardposter::db::sqlite
