#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace docbuild::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository. Each transaction checks
  out one connection; libpqxx connections are not shared across threads.

  - Prepared statements for the queue and status hot paths are installed
    once per connection when it is opened
  - Connections that were closed while idle or in use are dropped and
    replaced lazily
  - Acquire blocks once max_connections are checked out
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // The returned connection goes back to the pool when the last reference drops.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);
  void                              Discard();

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace docbuild::db::postgres
