#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace docbuild::db::sqlite {

/*
  SQLite transaction wrapper.

  BEGIN IMMEDIATE takes the database write lock up front, so a queue claim
  or checkpoint CAS never upgrades from a read lock halfway through. Another
  process holding the lock past busy_timeout surfaces as util::Conflict,
  from the constructor or from Commit(); an unfinished transaction rolls
  back in the destructor.

  Holds the connection's transaction mutex for its whole lifetime, so a
  thread must not open a second transaction while one is live.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_  = false;
};

}
