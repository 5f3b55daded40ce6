#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace docbuild::db::postgres {

/*
  One pooled connection + pqxx::work (READ COMMITTED). Conditional
  UPDATEs re-check their WHERE clause against the latest committed row,
  which is what the queue claim and checkpoint CAS rely on.

  Commit maps serialization failures and deadlocks to util::Conflict so
  db::RetryOnConflict treats every backend alike.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
  bool finished_  = false;
};

}
