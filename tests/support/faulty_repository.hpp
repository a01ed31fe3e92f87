#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace chronicle::testing {

/*
  MemoryRepository with switchable failures for error-path tests.
*/
class FaultyRepository final : public db::Repository {
 public:
  std::atomic<bool> fail_reads{false};
  std::atomic<bool> fail_inserts{false};
  std::atomic<bool> fail_positions{false};
  std::atomic<bool> fail_products{false};

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }

  db::Result LockOrCreateStream(db::Transaction& tx, db::model::StreamRecord& stream) override {
    return inner_.LockOrCreateStream(tx, stream);
  }

  std::optional<db::model::StreamRecord> GetStream(db::Transaction& tx, const std::string& type, const std::string& id) override {
    MaybeFailRead();
    return inner_.GetStream(tx, type, id);
  }

  db::Result UpdateStreamVersion(db::Transaction& tx, const std::string& stream_id, uint64_t version, uint64_t at) override {
    return inner_.UpdateStreamVersion(tx, stream_id, version, at);
  }

  db::Result InsertEvents(db::Transaction& tx, std::vector<db::model::EventRecord>& events) override {
    if (fail_inserts) return db::Result::Err(db::ErrorCode::IOError, "injected insert failure");
    return inner_.InsertEvents(tx, events);
  }

  std::vector<db::model::EventRecord> ReadStreamEvents(db::Transaction& tx, const std::string& stream_id, uint64_t after) override {
    MaybeFailRead();
    return inner_.ReadStreamEvents(tx, stream_id, after);
  }

  std::vector<db::model::EventRecord> ReadEventsAfter(db::Transaction& tx, std::optional<uint64_t> after, uint64_t limit) override {
    MaybeFailRead();
    return inner_.ReadEventsAfter(tx, after, limit);
  }

  std::vector<db::model::EventRecord> FindEventsByCorrelationId(db::Transaction& tx, const std::string& id) override {
    MaybeFailRead();
    return inner_.FindEventsByCorrelationId(tx, id);
  }

  std::optional<uint64_t> GetLatestSequence(db::Transaction& tx) override {
    MaybeFailRead();
    return inner_.GetLatestSequence(tx);
  }

  uint64_t CountEventsAfter(db::Transaction& tx, std::optional<uint64_t> after) override {
    MaybeFailRead();
    return inner_.CountEventsAfter(tx, after);
  }

  std::optional<db::model::ProjectionPositionRecord> GetProjectionPosition(db::Transaction& tx, const std::string& name) override {
    if (fail_positions) throw db::DbError(db::ErrorCode::IOError, "injected position read failure");
    return inner_.GetProjectionPosition(tx, name);
  }

  db::Result AdvanceProjectionPosition(db::Transaction& tx, const std::string& name, const std::string& event_id, uint64_t seq,
                                       uint64_t at) override {
    if (fail_positions) return db::Result::Err(db::ErrorCode::IOError, "injected position write failure");
    return inner_.AdvanceProjectionPosition(tx, name, event_id, seq, at);
  }

  db::Result DeleteProjectionPosition(db::Transaction& tx, const std::string& name) override {
    return inner_.DeleteProjectionPosition(tx, name);
  }

  std::vector<db::model::ProjectionPositionRecord> ListProjectionPositions(db::Transaction& tx) override {
    return inner_.ListProjectionPositions(tx);
  }

  db::Result UpsertProduct(db::Transaction& tx, const db::model::ProductRecord& product) override {
    if (fail_products) return db::Result::Err(db::ErrorCode::IOError, "injected product write failure");
    return inner_.UpsertProduct(tx, product);
  }

  std::optional<db::model::ProductRecord> GetProduct(db::Transaction& tx, const std::string& id) override {
    MaybeFailProductRead();
    return inner_.GetProduct(tx, id);
  }

  std::optional<db::model::ProductRecord> GetProductBySku(db::Transaction& tx, const std::string& sku) override {
    MaybeFailProductRead();
    return inner_.GetProductBySku(tx, sku);
  }

  std::vector<db::model::ProductRecord> QueryProducts(db::Transaction& tx, const db::model::ProductQuery& query) override {
    MaybeFailProductRead();
    return inner_.QueryProducts(tx, query);
  }

  uint64_t CountProducts(db::Transaction& tx, const db::model::ProductQuery& query) override {
    MaybeFailProductRead();
    return inner_.CountProducts(tx, query);
  }

  db::Result DeleteAllProducts(db::Transaction& tx) override {
    if (fail_products) return db::Result::Err(db::ErrorCode::IOError, "injected product write failure");
    return inner_.DeleteAllProducts(tx);
  }

 private:
  void MaybeFailRead() {
    if (fail_reads) throw db::DbError(db::ErrorCode::Busy, "injected read failure");
  }

  void MaybeFailProductRead() {
    if (fail_products) throw db::DbError(db::ErrorCode::IOError, "injected product read failure");
  }

  db::memory::MemoryRepository inner_;
};

} // namespace chronicle::testing
