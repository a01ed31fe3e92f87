#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace chronicle::db::memory {

class MemoryTransaction;

/*
  Process-local backend.

  Committed state lives behind mutex_. A transaction buffers its writes and
  publishes them in Commit(); global sequences are handed out there, so
  sequence order is commit order.

  Appenders serialize per aggregate through row locks (one mutex per
  aggregate key) that the transaction holds until it finishes. Different
  aggregates never wait on each other except for the short commit section.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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

  // Aggregates with a live row-lock slot. A slot is dropped when its last
  // holder or waiter lets go.
  std::size_t RowLockCount();

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::StreamRecord> streams; // by stream_id
    std::unordered_map<std::string, std::string> aggregate_to_stream;

    // ascending global_sequence
    std::vector<model::EventRecord> events;
    std::unordered_map<std::string, std::vector<std::size_t>> stream_events;

    std::map<std::string, model::ProjectionPositionRecord> positions;
    std::map<std::string, model::ProductRecord> products;
    uint64_t last_sequence = 0;
  };

  static std::string AggregateKey(const std::string& aggregate_type, const std::string& aggregate_id);

  std::shared_ptr<std::mutex> RowLock(const std::string& aggregate_key);

  // Called with the mutex already unlocked; gives up `held` and erases the
  // slot when nobody else references it.
  void ReleaseRowLock(const std::string& aggregate_key, std::shared_ptr<std::mutex>& held);

  // Committed products with this transaction's writes laid over them.
  std::map<std::string, model::ProductRecord> MergedProducts(MemoryTransaction& tx);

  std::optional<model::StreamRecord> FindStreamById(MemoryTransaction& tx, const std::string& stream_id);

  std::mutex mutex_;
  State committed_;

  std::mutex row_locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> row_locks_;
};

} // namespace chronicle::db::memory
