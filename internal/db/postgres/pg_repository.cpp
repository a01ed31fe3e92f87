#include "pg_repository.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chronicle::db::postgres {

namespace {

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

model::StreamRecord ReadStream(const pqxx::row& row) {
  model::StreamRecord r;
  r.stream_id      = row[0].c_str();
  r.aggregate_type = row[1].c_str();
  r.aggregate_id   = row[2].c_str();
  r.version        = row[3].as<uint64_t>();
  r.created_at_ms  = row[4].as<uint64_t>();
  r.updated_at_ms  = row[5].as<uint64_t>();
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord e;
  e.event_id             = row[0].c_str();
  e.stream_id            = row[1].c_str();
  e.aggregate_type       = row[2].c_str();
  e.aggregate_id         = row[3].c_str();
  e.event_type           = row[4].c_str();
  e.event_schema_version = row[5].as<uint32_t>();
  e.aggregate_version    = row[6].as<uint64_t>();
  e.payload              = row[7].c_str();
  e.metadata             = row[8].c_str();
  e.occurred_at_ms       = row[9].as<uint64_t>();
  e.causation_id         = row[10].c_str();
  e.correlation_id       = row[11].c_str();
  e.user_id              = row[12].c_str();
  e.global_sequence      = row[13].as<uint64_t>();
  return e;
}

model::ProjectionPositionRecord ReadPosition(const pqxx::row& row) {
  model::ProjectionPositionRecord p;
  p.projection_name = row[0].c_str();
  p.last_event_id   = row[1].c_str();
  if (!row[2].is_null()) p.last_global_sequence = row[2].as<uint64_t>();
  p.events_processed     = row[3].as<uint64_t>();
  p.last_processed_at_ms = row[4].as<uint64_t>();
  return p;
}

model::ProductRecord ReadProduct(const pqxx::row& row) {
  model::ProductRecord p;
  p.id                = row[0].c_str();
  p.sku               = row[1].c_str();
  p.name              = row[2].c_str();
  p.description       = row[3].c_str();
  p.price_cents       = row[4].as<int64_t>();
  p.price_display     = row[5].c_str();
  p.status            = row[6].c_str();
  p.search_text       = row[7].c_str();
  p.aggregate_version = row[8].as<uint64_t>();
  p.last_event_id     = row[9].c_str();
  p.created_at_ms     = row[10].as<uint64_t>();
  p.updated_at_ms     = row[11].as<uint64_t>();
  p.deleted           = row[12].as<bool>();
  return p;
}

const char* ProductQueryStatement(model::ProductSort sort) {
  switch (sort) {
    case model::ProductSort::kPriceAsc: return "query_products_by_price";
    case model::ProductSort::kNewest: return "query_products_newest";
    case model::ProductSort::kName: break;
  }
  return "query_products_by_name";
}

int64_t Cursor(std::optional<uint64_t> after_sequence) {
  return after_sequence ? static_cast<int64_t>(*after_sequence) : 0;
}

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  // pooled connections prepare statements against the tables, so the
  // bootstrap uses its own connection
  explicit PgMigrationExecutor(const std::string& conninfo) : conn_(conninfo) {
  }

  void ExecuteSQL(const std::string& sql) override {
    pqxx::work tx(conn_);
    tx.exec(sql);
    tx.commit();
  }

  int AppliedVersion() override {
    pqxx::work tx(conn_);
    auto       res = tx.exec("SELECT COALESCE(MAX(version),0) FROM schema_migrations");
    tx.commit();
    return res[0][0].as<int>();
  }

 private:
  pqxx::connection conn_;
};

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

void PgRepository::Rethrow(const std::exception& e) {
  auto r = Translate(e);
  throw DbError(r.code, r.message);
}

int PgRepository::Migrate() {
  try {
    PgMigrationExecutor executor(pool_->ConnInfo());
    return sql::RunMigrations(executor, sql::PostgresMigrations());
  } catch (const pqxx::failure& e) {
    Rethrow(e);
  }
}

/* ---------------- Streams ---------------- */

Result PgRepository::LockOrCreateStream(Transaction& t, model::StreamRecord& stream) {
  try {
    auto&          w   = TX(t).Work();
    const uint64_t now = util::NowMillis();

    // a concurrent creator makes this wait, then do nothing
    w.exec_prepared("ensure_stream", util::NewUuidString(), stream.aggregate_type, stream.aggregate_id, now);

    auto res = w.exec_prepared("lock_stream", stream.aggregate_type, stream.aggregate_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, "stream vanished after creation");

    stream = ReadStream(res[0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::StreamRecord> PgRepository::GetStream(Transaction& t, const std::string& aggregate_type,
                                                           const std::string& aggregate_id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_stream", aggregate_type, aggregate_id);
    if (res.empty()) return std::nullopt;
    return ReadStream(res[0]);
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

Result PgRepository::UpdateStreamVersion(Transaction& t, const std::string& stream_id, uint64_t version,
                                         uint64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("update_stream_version", stream_id, version, updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "stream not found: " + stream_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

/* ---------------- Events ---------------- */

Result PgRepository::InsertEvents(Transaction& t, std::vector<model::EventRecord>& events) {
  try {
    auto& tx = TX(t);

    // BIGSERIAL hands out values at insert time; holding this lock until
    // commit makes sequence order match commit order
    tx.LockEventSequence();

    for (auto& e : events) {
      auto res = tx.Work().exec_prepared("insert_event", e.event_id, e.stream_id, e.event_type, e.event_schema_version,
                                         e.aggregate_version, e.payload, e.metadata, e.occurred_at_ms,
                                         NullIfEmpty(e.causation_id), NullIfEmpty(e.correlation_id),
                                         NullIfEmpty(e.user_id));
      e.global_sequence = res[0][0].as<uint64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadStreamEvents(Transaction& t, const std::string& stream_id,
                                                               uint64_t after_version) {
  try {
    auto res = TX(t).Work().exec_prepared("stream_events", stream_id, after_version);

    std::vector<model::EventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res)
      out.push_back(ReadEvent(row));
    return out;
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadEventsAfter(Transaction& t, std::optional<uint64_t> after_sequence,
                                                              uint64_t limit) {
  if (limit == 0) return {};
  try {
    auto res = TX(t).Work().exec_prepared("events_after", Cursor(after_sequence), static_cast<int64_t>(limit));

    std::vector<model::EventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res)
      out.push_back(ReadEvent(row));
    return out;
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

std::vector<model::EventRecord> PgRepository::FindEventsByCorrelationId(Transaction& t,
                                                                        const std::string& correlation_id) {
  if (correlation_id.empty()) return {};
  try {
    auto res = TX(t).Work().exec_prepared("events_by_correlation", correlation_id);

    std::vector<model::EventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res)
      out.push_back(ReadEvent(row));
    return out;
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

std::optional<uint64_t> PgRepository::GetLatestSequence(Transaction& t) {
  try {
    auto res = TX(t).Work().exec_prepared("latest_sequence");
    if (res.empty() || res[0][0].is_null()) return std::nullopt;
    return res[0][0].as<uint64_t>();
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

uint64_t PgRepository::CountEventsAfter(Transaction& t, std::optional<uint64_t> after_sequence) {
  try {
    auto res = TX(t).Work().exec_prepared("count_after", Cursor(after_sequence));
    return res[0][0].as<uint64_t>();
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

/* ---------------- Projection positions ---------------- */

std::optional<model::ProjectionPositionRecord> PgRepository::GetProjectionPosition(Transaction& t,
                                                                                   const std::string& projection_name) {
  try {
    auto res = TX(t).Work().exec_prepared("get_position", projection_name);
    if (res.empty()) return std::nullopt;
    return ReadPosition(res[0]);
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

Result PgRepository::AdvanceProjectionPosition(Transaction& t, const std::string& projection_name,
                                               const std::string& event_id, uint64_t global_sequence,
                                               uint64_t processed_at_ms) {
  try {
    TX(t).Work().exec_prepared("advance_position", projection_name, event_id, global_sequence, processed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteProjectionPosition(Transaction& t, const std::string& projection_name) {
  try {
    TX(t).Work().exec_prepared("delete_position", projection_name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ProjectionPositionRecord> PgRepository::ListProjectionPositions(Transaction& t) {
  try {
    auto res = TX(t).Work().exec_prepared("list_positions");

    std::vector<model::ProjectionPositionRecord> out;
    out.reserve(res.size());
    for (const auto& row : res)
      out.push_back(ReadPosition(row));
    return out;
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

/* ---------------- Product read model ---------------- */

Result PgRepository::UpsertProduct(Transaction& t, const model::ProductRecord& product) {
  try {
    TX(t).Work().exec_prepared("upsert_product", product.id, product.sku, product.name, product.description,
                               product.price_cents, product.price_display, product.status, product.search_text,
                               product.aggregate_version, NullIfEmpty(product.last_event_id), product.created_at_ms,
                               product.updated_at_ms, product.deleted);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProductRecord> PgRepository::GetProduct(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_product", id);
    if (res.empty()) return std::nullopt;
    return ReadProduct(res[0]);
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

std::optional<model::ProductRecord> PgRepository::GetProductBySku(Transaction& t, const std::string& sku) {
  try {
    auto res = TX(t).Work().exec_prepared("get_product_by_sku", sku);
    if (res.empty()) return std::nullopt;
    return ReadProduct(res[0]);
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

std::vector<model::ProductRecord> PgRepository::QueryProducts(Transaction& t, const model::ProductQuery& query) {
  try {
    std::optional<int64_t> limit;
    if (query.limit > 0) limit = static_cast<int64_t>(query.limit);

    auto res = TX(t).Work().exec_prepared(ProductQueryStatement(query.sort), query.status, query.min_price_cents,
                                          query.max_price_cents, query.search, query.include_deleted, limit,
                                          static_cast<int64_t>(query.offset));

    std::vector<model::ProductRecord> out;
    out.reserve(res.size());
    for (const auto& row : res)
      out.push_back(ReadProduct(row));
    return out;
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

uint64_t PgRepository::CountProducts(Transaction& t, const model::ProductQuery& query) {
  try {
    auto res = TX(t).Work().exec_prepared("count_products", query.status, query.min_price_cents, query.max_price_cents,
                                          query.search, query.include_deleted);
    return res[0][0].as<uint64_t>();
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

Result PgRepository::DeleteAllProducts(Transaction& t) {
  try {
    TX(t).Work().exec_prepared("delete_all_products");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

}
