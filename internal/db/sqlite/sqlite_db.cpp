#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace docbuild::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc == SQLITE_OK) {
    return;
  }
  const std::string msg = std::string(what) + ": " + sqlite3_errmsg(db);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::Conflict(msg);
  }
  throw std::runtime_error(msg);
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(path_ + ": " + msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
      throw util::Conflict(msg);
    }
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // in-memory databases ignore WAL
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks held by other processes instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  ThrowIf(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_, "sqlite prepare");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& s) {
  sqlite3_bind_text(stmt_, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void Statement::BindU64(int idx, uint64_t v) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
}

void Statement::BindI64(int idx, int64_t v) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
}

void Statement::BindOptU64(int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(idx, *v);
  } else {
    sqlite3_bind_null(stmt_, idx);
  }
}

void Statement::BindBool(int idx, bool v) {
  sqlite3_bind_int(stmt_, idx, v ? 1 : 0);
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

uint64_t Statement::ColU64(int col) const {
  return static_cast<uint64_t>(sqlite3_column_int64(stmt_, col));
}

int64_t Statement::ColI64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

bool Statement::ColBool(int col) const {
  return sqlite3_column_int(stmt_, col) != 0;
}

bool Statement::ColIsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

} // namespace docbuild::db::sqlite
