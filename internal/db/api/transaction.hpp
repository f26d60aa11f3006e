#pragma once

namespace cardposter::db {

/*
  Unit of work over the cache index.

  A CacheStore operation opens one transaction, reads the entry, applies its
  status/access changes and commits. Until Commit() no other transaction sees
  the changes; a transaction dropped while still open rolls back.

  SQLite: BEGIN IMMEDIATE, one writer at a time
  Memory: private copy of the index, published on commit
*/

class Transaction {
public:
  enum class State { kOpen, kCommitted, kRolledBack };

  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual State state() const = 0;
  bool          open() const { return state() == State::kOpen; }
};

} // namespace cardposter::db
