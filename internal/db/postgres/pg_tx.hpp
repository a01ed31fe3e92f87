#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace chronicle::db::postgres {

/*
  READ COMMITTED pqxx::work on a pooled connection.

  Row locks taken with SELECT ... FOR UPDATE and the event-insert advisory
  lock are both released at commit/rollback.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

  // Takes the event-insert advisory lock once per transaction.
  void LockEventSequence();

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
  bool sequence_locked_ = false;
};

}
