#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/sql/schema.hpp"

namespace docbuild::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the whole process; transactions on it are
  serialized through TransactionMutex() since SQLite has no nested
  BEGIN on a single connection.
*/
class SqliteDB final : public sql::SchemaExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema). BUSY/LOCKED throw util::Conflict.
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Prepared statement, finalized on scope exit. Bind indexes are 1-based,
  column indexes 0-based (sqlite convention).
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& s);
  void BindU64(int idx, uint64_t v);
  void BindI64(int idx, int64_t v);
  void BindOptU64(int idx, const std::optional<uint64_t>& v);
  void BindBool(int idx, bool v);

  // Returns the raw sqlite rc (SQLITE_ROW / SQLITE_DONE / error)
  int Step();

  std::string ColText(int col) const;
  uint64_t    ColU64(int col) const;
  int64_t     ColI64(int col) const;
  bool        ColBool(int col) const;
  bool        ColIsNull(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace docbuild::db::sqlite
