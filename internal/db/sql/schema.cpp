#include "schema.hpp"

namespace docbuild::db::sql {

namespace {

const std::vector<std::string> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS packages (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, normalized_name TEXT NOT NULL UNIQUE, "
    "latest_release_id INTEGER NOT NULL DEFAULT 0, downloads INTEGER NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS releases (id INTEGER PRIMARY KEY AUTOINCREMENT, package_id INTEGER NOT NULL REFERENCES packages(id) ON DELETE CASCADE, "
    "version TEXT NOT NULL, yanked INTEGER NOT NULL DEFAULT 0, is_library INTEGER NOT NULL DEFAULT 1, dependencies TEXT NOT NULL DEFAULT '', "
    "targets TEXT NOT NULL DEFAULT '', default_target TEXT NOT NULL DEFAULT '', doc_targets TEXT NOT NULL DEFAULT '', has_docs INTEGER NOT NULL DEFAULT 0, "
    "documented_items INTEGER NOT NULL DEFAULT 0, total_items INTEGER NOT NULL DEFAULT 0, UNIQUE(package_id, version));",
    "CREATE TABLE IF NOT EXISTS builds (id INTEGER PRIMARY KEY AUTOINCREMENT, release_id INTEGER NOT NULL REFERENCES releases(id) ON DELETE CASCADE, "
    "toolchain_version TEXT NOT NULL, builder_version TEXT NOT NULL, status INTEGER NOT NULL, started_at_ms INTEGER NOT NULL, "
    "finished_at_ms INTEGER NOT NULL DEFAULT 0, log TEXT NOT NULL DEFAULT '', worker TEXT NOT NULL DEFAULT '');",
    "CREATE INDEX IF NOT EXISTS builds_release_idx ON builds(release_id);",
    "CREATE TABLE IF NOT EXISTS release_build_status (release_id INTEGER PRIMARY KEY REFERENCES releases(id) ON DELETE CASCADE, "
    "status INTEGER NOT NULL, last_build_time_ms INTEGER NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS build_queue (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, normalized_name TEXT NOT NULL, "
    "version TEXT NOT NULL, priority INTEGER NOT NULL, registry TEXT NOT NULL DEFAULT '', attempt INTEGER NOT NULL DEFAULT 0, "
    "last_attempt_ms INTEGER NOT NULL DEFAULT 0, queued_at_ms INTEGER NOT NULL, claimed_by TEXT NOT NULL DEFAULT '', "
    "claimed_at_ms INTEGER NOT NULL DEFAULT 0, UNIQUE(normalized_name, version));",
    "CREATE INDEX IF NOT EXISTS build_queue_order_idx ON build_queue(priority, id);",
    "CREATE TABLE IF NOT EXISTS priority_rules (id INTEGER PRIMARY KEY AUTOINCREMENT, pattern TEXT NOT NULL UNIQUE, priority INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS blacklist (normalized_name TEXT PRIMARY KEY);",
    "CREATE TABLE IF NOT EXISTS sandbox_overrides (normalized_name TEXT PRIMARY KEY, memory_bytes INTEGER, timeout_seconds INTEGER, max_targets INTEGER);",
    "CREATE TABLE IF NOT EXISTS sync_checkpoints (name TEXT PRIMARY KEY, reference TEXT NOT NULL DEFAULT '', version INTEGER NOT NULL DEFAULT 0, "
    "updated_at_ms INTEGER NOT NULL DEFAULT 0, lock_holder TEXT NOT NULL DEFAULT '', lock_expires_at_ms INTEGER NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
};

const std::vector<std::string> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS packages (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, normalized_name TEXT NOT NULL UNIQUE, "
    "latest_release_id BIGINT NOT NULL DEFAULT 0, downloads BIGINT NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS releases (id BIGSERIAL PRIMARY KEY, package_id BIGINT NOT NULL REFERENCES packages(id) ON DELETE CASCADE, "
    "version TEXT NOT NULL, yanked BOOLEAN NOT NULL DEFAULT FALSE, is_library BOOLEAN NOT NULL DEFAULT TRUE, dependencies TEXT NOT NULL DEFAULT '', "
    "targets TEXT NOT NULL DEFAULT '', default_target TEXT NOT NULL DEFAULT '', doc_targets TEXT NOT NULL DEFAULT '', "
    "has_docs BOOLEAN NOT NULL DEFAULT FALSE, documented_items BIGINT NOT NULL DEFAULT 0, total_items BIGINT NOT NULL DEFAULT 0, "
    "UNIQUE(package_id, version));",
    "CREATE TABLE IF NOT EXISTS builds (id BIGSERIAL PRIMARY KEY, release_id BIGINT NOT NULL REFERENCES releases(id) ON DELETE CASCADE, "
    "toolchain_version TEXT NOT NULL, builder_version TEXT NOT NULL, status SMALLINT NOT NULL, started_at_ms BIGINT NOT NULL, "
    "finished_at_ms BIGINT NOT NULL DEFAULT 0, log TEXT NOT NULL DEFAULT '', worker TEXT NOT NULL DEFAULT '');",
    "CREATE INDEX IF NOT EXISTS builds_release_idx ON builds(release_id);",
    "CREATE TABLE IF NOT EXISTS release_build_status (release_id BIGINT PRIMARY KEY REFERENCES releases(id) ON DELETE CASCADE, "
    "status SMALLINT NOT NULL, last_build_time_ms BIGINT NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS build_queue (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, normalized_name TEXT NOT NULL, "
    "version TEXT NOT NULL, priority INTEGER NOT NULL, registry TEXT NOT NULL DEFAULT '', attempt INTEGER NOT NULL DEFAULT 0, "
    "last_attempt_ms BIGINT NOT NULL DEFAULT 0, queued_at_ms BIGINT NOT NULL, claimed_by TEXT NOT NULL DEFAULT '', "
    "claimed_at_ms BIGINT NOT NULL DEFAULT 0, UNIQUE(normalized_name, version));",
    "CREATE INDEX IF NOT EXISTS build_queue_order_idx ON build_queue(priority, id);",
    "CREATE TABLE IF NOT EXISTS priority_rules (id BIGSERIAL PRIMARY KEY, pattern TEXT NOT NULL UNIQUE, priority INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS blacklist (normalized_name TEXT PRIMARY KEY);",
    "CREATE TABLE IF NOT EXISTS sandbox_overrides (normalized_name TEXT PRIMARY KEY, memory_bytes BIGINT, timeout_seconds INTEGER, max_targets INTEGER);",
    "CREATE TABLE IF NOT EXISTS sync_checkpoints (name TEXT PRIMARY KEY, reference TEXT NOT NULL DEFAULT '', version BIGINT NOT NULL DEFAULT 0, "
    "updated_at_ms BIGINT NOT NULL DEFAULT 0, lock_holder TEXT NOT NULL DEFAULT '', lock_expires_at_ms BIGINT NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
};

} // namespace

const std::vector<std::string>& SchemaStatements(Dialect dialect) {
  return dialect == Dialect::kPostgres ? kPostgresSchema : kSqliteSchema;
}

void ApplySchema(SchemaExecutor& executor, Dialect dialect) {
  for (const auto& sql : SchemaStatements(dialect)) {
    executor.ExecuteSQL(sql);
  }
}

std::string JoinList(const std::vector<std::string>& values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out.push_back('\n');
    out += values[i];
  }
  return out;
}

std::vector<std::string> SplitList(std::string_view text) {
  std::vector<std::string> out;
  if (text.empty()) {
    return out;
  }

  std::size_t start = 0;
  for (;;) {
    const auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      out.emplace_back(text.substr(start));
      return out;
    }
    out.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
}

} // namespace docbuild::db::sql
