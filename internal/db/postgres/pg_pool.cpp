#include "pg_pool.hpp"

namespace docbuild::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  for (;;) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) {
        return Wrap(conn.release());
      }
      // server restarted or dropped us while idle
      --live_connections_;
    }

    if (live_connections_ < max_connections_) {
      break;
    }
    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    Discard();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("list_queue_candidates",
               "SELECT id,name,normalized_name,version,priority,registry,attempt,last_attempt_ms,queued_at_ms,claimed_by,claimed_at_ms "
               "FROM build_queue WHERE attempt<$1 ORDER BY priority ASC, id ASC LIMIT $2 FOR UPDATE SKIP LOCKED");

  conn.prepare("claim_queue_entry",
               "UPDATE build_queue SET claimed_by=$2, claimed_at_ms=$3 "
               "WHERE id=$1 AND (claimed_by='' OR claimed_at_ms<$4)");

  conn.prepare("lock_release", "SELECT id FROM releases WHERE id=$1 FOR UPDATE");

  conn.prepare("finish_build",
               "UPDATE builds SET status=$2, finished_at_ms=$3, log=$4 "
               "WHERE id=$1 AND status=$5");

  conn.prepare("list_builds",
               "SELECT id,release_id,toolchain_version,builder_version,status,started_at_ms,finished_at_ms,log,worker "
               "FROM builds WHERE release_id=$1 ORDER BY id");

  conn.prepare("upsert_release_status",
               "INSERT INTO release_build_status(release_id,status,last_build_time_ms) VALUES($1,$2,$3) "
               "ON CONFLICT(release_id) DO UPDATE SET status=EXCLUDED.status, last_build_time_ms=EXCLUDED.last_build_time_ms");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  if (!conn->is_open()) {
    delete conn;
    Discard();
    return;
  }
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

void PgPool::Discard() {
  {
    std::lock_guard lock(mutex_);
    --live_connections_;
  }
  cv_.notify_one();
}

} // namespace docbuild::db::postgres
