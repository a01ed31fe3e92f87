#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace chronicle::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result LockOrCreateStream(Transaction&, model::StreamRecord& stream) override;
  std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& aggregate_type,
                                               const std::string& aggregate_id) override;
  Result UpdateStreamVersion(Transaction&, const std::string& stream_id, uint64_t version,
                             uint64_t updated_at_ms) override;

  Result InsertEvents(Transaction&, std::vector<model::EventRecord>& events) override;
  std::vector<model::EventRecord> ReadStreamEvents(Transaction&, const std::string& stream_id,
                                                   uint64_t after_version) override;
  std::vector<model::EventRecord> ReadEventsAfter(Transaction&, std::optional<uint64_t> after_sequence,
                                                  uint64_t limit) override;
  std::vector<model::EventRecord> FindEventsByCorrelationId(Transaction&, const std::string& correlation_id) override;
  std::optional<uint64_t> GetLatestSequence(Transaction&) override;
  uint64_t CountEventsAfter(Transaction&, std::optional<uint64_t> after_sequence) override;

  std::optional<model::ProjectionPositionRecord> GetProjectionPosition(Transaction&,
                                                                       const std::string& projection_name) override;
  Result AdvanceProjectionPosition(Transaction&, const std::string& projection_name, const std::string& event_id,
                                   uint64_t global_sequence, uint64_t processed_at_ms) override;
  Result DeleteProjectionPosition(Transaction&, const std::string& projection_name) override;
  std::vector<model::ProjectionPositionRecord> ListProjectionPositions(Transaction&) override;

  Result UpsertProduct(Transaction&, const model::ProductRecord& product) override;
  std::optional<model::ProductRecord> GetProduct(Transaction&, const std::string& id) override;
  std::optional<model::ProductRecord> GetProductBySku(Transaction&, const std::string& sku) override;
  std::vector<model::ProductRecord> QueryProducts(Transaction&, const model::ProductQuery& query) override;
  uint64_t CountProducts(Transaction&, const model::ProductQuery& query) override;
  Result DeleteAllProducts(Transaction&) override;

  // Create or upgrade the event store tables. Returns migrations applied.
  int Migrate();

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
  [[noreturn]] static void Rethrow(const std::exception& e);
};

}
