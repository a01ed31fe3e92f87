#include "memory_repository.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "memory_tx.hpp"

namespace chronicle::db::memory {

namespace {

MemoryTransaction& TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

bool BySequence(uint64_t sequence, const model::EventRecord& e) {
  return sequence < e.global_sequence;
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool Matches(const model::ProductRecord& p, const model::ProductQuery& q, const std::string& needle) {
  if (p.deleted && !q.include_deleted) return false;
  if (q.status && p.status != *q.status) return false;
  if (q.min_price_cents && p.price_cents < *q.min_price_cents) return false;
  if (q.max_price_cents && p.price_cents > *q.max_price_cents) return false;
  return needle.empty() || Lower(p.search_text).find(needle) != std::string::npos;
}

bool ProductBefore(model::ProductSort sort, const model::ProductRecord& a, const model::ProductRecord& b) {
  switch (sort) {
    case model::ProductSort::kPriceAsc:
      if (a.price_cents != b.price_cents) return a.price_cents < b.price_cents;
      return a.id < b.id;
    case model::ProductSort::kNewest:
      if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
      return a.id > b.id;
    case model::ProductSort::kName: break;
  }
  if (a.name != b.name) return a.name < b.name;
  return a.id < b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

std::string MemoryRepository::AggregateKey(const std::string& aggregate_type, const std::string& aggregate_id) {
  std::string key;
  key.reserve(aggregate_type.size() + aggregate_id.size() + 1);
  key.append(aggregate_type).push_back('\0');
  key.append(aggregate_id);
  return key;
}

std::shared_ptr<std::mutex> MemoryRepository::RowLock(const std::string& aggregate_key) {
  std::scoped_lock lock(row_locks_mutex_);
  auto&            slot = row_locks_[aggregate_key];
  if (!slot) slot = std::make_shared<std::mutex>();
  return slot;
}

void MemoryRepository::ReleaseRowLock(const std::string& aggregate_key, std::shared_ptr<std::mutex>& held) {
  std::scoped_lock lock(row_locks_mutex_);

  auto it = row_locks_.find(aggregate_key);
  // the slot and `held` are the only references: no holder, no waiter
  if (it != row_locks_.end() && it->second == held && held.use_count() == 2) row_locks_.erase(it);
  held.reset();
}

std::size_t MemoryRepository::RowLockCount() {
  std::scoped_lock lock(row_locks_mutex_);
  return row_locks_.size();
}

std::optional<model::StreamRecord> MemoryRepository::FindStreamById(MemoryTransaction& tx, const std::string& stream_id) {
  auto& pending = tx.Writes().streams;
  if (auto it = pending.find(stream_id); it != pending.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.streams.find(stream_id);
  if (it == committed_.streams.end()) return std::nullopt;
  return it->second;
}

/* ---------------- Streams ---------------- */

Result MemoryRepository::LockOrCreateStream(Transaction& t, model::StreamRecord& stream) {
  auto& tx = TX(t);

  // blocks outside mutex_ so other aggregates keep committing
  tx.AcquireRowLock(AggregateKey(stream.aggregate_type, stream.aggregate_id));

  if (auto existing = GetStream(t, stream.aggregate_type, stream.aggregate_id)) {
    stream = *existing;
    return Result::Ok();
  }

  const uint64_t now   = util::NowMillis();
  stream.stream_id     = util::NewUuidString();
  stream.version       = 0;
  stream.created_at_ms = now;
  stream.updated_at_ms = now;

  tx.Writes().streams[stream.stream_id] = stream;
  return Result::Ok();
}

std::optional<model::StreamRecord> MemoryRepository::GetStream(Transaction& t, const std::string& aggregate_type,
                                                               const std::string& aggregate_id) {
  auto& tx = TX(t);

  for (const auto& [id, s] : tx.Writes().streams) {
    if (s.aggregate_type == aggregate_type && s.aggregate_id == aggregate_id) return s;
  }

  std::scoped_lock lock(mutex_);
  auto             it = committed_.aggregate_to_stream.find(AggregateKey(aggregate_type, aggregate_id));
  if (it == committed_.aggregate_to_stream.end()) return std::nullopt;
  return committed_.streams.at(it->second);
}

Result MemoryRepository::UpdateStreamVersion(Transaction& t, const std::string& stream_id, uint64_t version,
                                             uint64_t updated_at_ms) {
  auto& tx     = TX(t);
  auto  stream = FindStreamById(tx, stream_id);
  if (!stream) return Result::Err(ErrorCode::NotFound, "stream not found: " + stream_id);

  if (!tx.HoldsRowLock(AggregateKey(stream->aggregate_type, stream->aggregate_id))) {
    return Result::Err(ErrorCode::Conflict, "stream not locked by transaction: " + stream_id);
  }

  stream->version       = version;
  stream->updated_at_ms = updated_at_ms;
  tx.Writes().streams[stream_id] = *stream;
  return Result::Ok();
}

/* ---------------- Events ---------------- */

Result MemoryRepository::InsertEvents(Transaction& t, std::vector<model::EventRecord>& events) {
  auto& tx = TX(t);

  for (auto& e : events) {
    auto stream = FindStreamById(tx, e.stream_id);
    if (!stream) return Result::Err(ErrorCode::NotFound, "stream not found: " + e.stream_id);

    if (!tx.HoldsRowLock(AggregateKey(stream->aggregate_type, stream->aggregate_id))) {
      return Result::Err(ErrorCode::Conflict, "stream not locked by transaction: " + e.stream_id);
    }

    if (e.aggregate_version == 0) {
      return Result::Err(ErrorCode::ConstraintViolation, "aggregate versions start at 1");
    }

    std::vector<model::EventRecord> existing = ReadStreamEvents(t, e.stream_id, e.aggregate_version - 1);
    if (!existing.empty() && existing.front().aggregate_version == e.aggregate_version) {
      return Result::Err(ErrorCode::ConstraintViolation,
                         "duplicate aggregate version " + std::to_string(e.aggregate_version) + " in " + e.stream_id);
    }

    e.aggregate_type = stream->aggregate_type;
    e.aggregate_id   = stream->aggregate_id;
  }

  for (const auto& e : events)
    tx.Writes().events.push_back(e);

  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadStreamEvents(Transaction& t, const std::string& stream_id,
                                                                   uint64_t after_version) {
  auto&                           tx = TX(t);
  std::vector<model::EventRecord> out;

  {
    std::scoped_lock lock(mutex_);
    auto             it = committed_.stream_events.find(stream_id);
    if (it != committed_.stream_events.end()) {
      for (std::size_t idx : it->second) {
        const auto& e = committed_.events[idx];
        if (e.aggregate_version > after_version) out.push_back(e);
      }
    }
  }

  for (const auto& e : tx.Writes().events) {
    if (e.stream_id == stream_id && e.aggregate_version > after_version) out.push_back(e);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.aggregate_version < b.aggregate_version; });
  return out;
}

std::vector<model::EventRecord> MemoryRepository::ReadEventsAfter(Transaction&, std::optional<uint64_t> after_sequence,
                                                                  uint64_t limit) {
  std::scoped_lock lock(mutex_);

  auto begin = committed_.events.begin();
  if (after_sequence) begin = std::upper_bound(committed_.events.begin(), committed_.events.end(), *after_sequence, BySequence);

  const auto available = static_cast<uint64_t>(committed_.events.end() - begin);
  const auto count     = std::min(available, limit);

  return {begin, begin + static_cast<std::ptrdiff_t>(count)};
}

std::vector<model::EventRecord> MemoryRepository::FindEventsByCorrelationId(Transaction&,
                                                                            const std::string& correlation_id) {
  std::scoped_lock                lock(mutex_);
  std::vector<model::EventRecord> out;

  for (const auto& e : committed_.events) {
    if (!correlation_id.empty() && e.correlation_id == correlation_id) out.push_back(e);
  }
  return out;
}

std::optional<uint64_t> MemoryRepository::GetLatestSequence(Transaction&) {
  std::scoped_lock lock(mutex_);
  if (committed_.events.empty()) return std::nullopt;
  return committed_.events.back().global_sequence;
}

uint64_t MemoryRepository::CountEventsAfter(Transaction&, std::optional<uint64_t> after_sequence) {
  std::scoped_lock lock(mutex_);
  if (!after_sequence) return committed_.events.size();

  auto it = std::upper_bound(committed_.events.begin(), committed_.events.end(), *after_sequence, BySequence);
  return static_cast<uint64_t>(committed_.events.end() - it);
}

/* ---------------- Projection positions ---------------- */

std::optional<model::ProjectionPositionRecord> MemoryRepository::GetProjectionPosition(Transaction& t,
                                                                                       const std::string& projection_name) {
  auto& pending = TX(t).Writes().positions;
  if (auto it = pending.find(projection_name); it != pending.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.positions.find(projection_name);
  if (it == committed_.positions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::AdvanceProjectionPosition(Transaction& t, const std::string& projection_name,
                                                   const std::string& event_id, uint64_t global_sequence,
                                                   uint64_t processed_at_ms) {
  model::ProjectionPositionRecord next;
  if (auto current = GetProjectionPosition(t, projection_name)) next = *current;

  next.projection_name      = projection_name;
  next.last_event_id        = event_id;
  next.last_global_sequence = global_sequence;
  next.events_processed += 1;
  next.last_processed_at_ms = processed_at_ms;

  TX(t).Writes().positions[projection_name] = next;
  return Result::Ok();
}

Result MemoryRepository::DeleteProjectionPosition(Transaction& t, const std::string& projection_name) {
  TX(t).Writes().positions[projection_name] = std::nullopt;
  return Result::Ok();
}

std::vector<model::ProjectionPositionRecord> MemoryRepository::ListProjectionPositions(Transaction& t) {
  std::map<std::string, model::ProjectionPositionRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    merged = committed_.positions;
  }

  for (const auto& [name, position] : TX(t).Writes().positions) {
    if (position) {
      merged[name] = *position;
    } else {
      merged.erase(name);
    }
  }

  std::vector<model::ProjectionPositionRecord> out;
  out.reserve(merged.size());
  for (auto& [name, position] : merged)
    out.push_back(std::move(position));
  return out;
}

/* ---------------- Product read model ---------------- */

std::map<std::string, model::ProductRecord> MemoryRepository::MergedProducts(MemoryTransaction& tx) {
  const auto& writes = tx.Writes();

  std::map<std::string, model::ProductRecord> merged;
  if (!writes.products_cleared) {
    std::scoped_lock lock(mutex_);
    merged = committed_.products;
  }
  for (const auto& [id, product] : writes.products)
    merged[id] = product;
  return merged;
}

Result MemoryRepository::UpsertProduct(Transaction& t, const model::ProductRecord& product) {
  if (product.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "product id is required");
  TX(t).Writes().products[product.id] = product;
  return Result::Ok();
}

std::optional<model::ProductRecord> MemoryRepository::GetProduct(Transaction& t, const std::string& id) {
  const auto& writes = TX(t).Writes();
  if (auto it = writes.products.find(id); it != writes.products.end()) return it->second;
  if (writes.products_cleared) return std::nullopt;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.products.find(id);
  if (it == committed_.products.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ProductRecord> MemoryRepository::GetProductBySku(Transaction& t, const std::string& sku) {
  // ordered by id, so the first live match has the lowest id
  for (auto& [id, product] : MergedProducts(TX(t))) {
    if (!product.deleted && product.sku == sku) return std::move(product);
  }
  return std::nullopt;
}

std::vector<model::ProductRecord> MemoryRepository::QueryProducts(Transaction& t, const model::ProductQuery& query) {
  const auto needle = Lower(query.search);

  std::vector<model::ProductRecord> matched;
  for (auto& [id, product] : MergedProducts(TX(t))) {
    if (Matches(product, query, needle)) matched.push_back(std::move(product));
  }

  std::sort(matched.begin(), matched.end(),
            [&query](const auto& a, const auto& b) { return ProductBefore(query.sort, a, b); });

  if (query.offset >= matched.size()) return {};
  auto begin = matched.begin() + static_cast<std::ptrdiff_t>(query.offset);
  auto end   = matched.end();
  if (query.limit > 0 && query.limit < static_cast<uint64_t>(end - begin)) {
    end = begin + static_cast<std::ptrdiff_t>(query.limit);
  }
  return {std::make_move_iterator(begin), std::make_move_iterator(end)};
}

uint64_t MemoryRepository::CountProducts(Transaction& t, const model::ProductQuery& query) {
  const auto needle = Lower(query.search);

  uint64_t count = 0;
  for (const auto& [id, product] : MergedProducts(TX(t))) {
    if (Matches(product, query, needle)) ++count;
  }
  return count;
}

Result MemoryRepository::DeleteAllProducts(Transaction& t) {
  auto& writes            = TX(t).Writes();
  writes.products_cleared = true;
  writes.products.clear();
  return Result::Ok();
}

} // namespace chronicle::db::memory
