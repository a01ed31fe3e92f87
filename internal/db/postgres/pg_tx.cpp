#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace chronicle::db::postgres {

namespace {

// arbitrary, shared by every chronicle writer on the database
constexpr long long kEventSequenceLockKey = 0x6368726f6e69636cLL;

} // namespace

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      CHRONICLE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::LockEventSequence() {
  if (sequence_locked_) return;
  tx_->exec_params("SELECT pg_advisory_xact_lock($1)", kEventSequenceLockKey);
  sequence_locked_ = true;
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  committed_ = true;
  tx_->abort();
}

}
