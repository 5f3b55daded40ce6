#pragma once

namespace docbuild::db {

/*
  One unit of work against a Repository.

  Every backend guarantees:

  - Writes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Destruction without Commit() rolls back
  - Commit() throws util::Conflict when a concurrent writer won; the
    caller re-runs the whole unit (db::RetryOnConflict)

  Backends:
    Memory:   snapshot copy, optimistic commit
    SQLite:   BEGIN IMMEDIATE, one writer per process at a time
    Postgres: pqxx::work at READ COMMITTED plus conditional UPDATEs
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace docbuild::db
