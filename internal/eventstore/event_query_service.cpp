#include "event_query_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace chronicle::eventstore {

namespace {

template <typename Fn>
auto InReadTransaction(db::Repository& repo, const char* op, Fn&& fn) {
  try {
    auto tx     = repo.Begin();
    auto result = fn(*tx);
    tx->Commit();
    return result;
  } catch (const db::DbError& e) {
    throw util::StorageError(e.code(), std::string(op) + ": " + e.what());
  }
}

} // namespace

EventQueryService::EventQueryService(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<db::model::EventRecord> EventQueryService::EventsAfter(std::optional<uint64_t> cursor, uint64_t limit) const {
  if (limit == 0) return {};
  return InReadTransaction(*repository_, "events after",
                           [&](db::Transaction& tx) { return repository_->ReadEventsAfter(tx, cursor, limit); });
}

std::optional<uint64_t> EventQueryService::LatestSequence() const {
  return InReadTransaction(*repository_, "latest sequence",
                           [&](db::Transaction& tx) { return repository_->GetLatestSequence(tx); });
}

uint64_t EventQueryService::CountAfter(std::optional<uint64_t> cursor) const {
  return InReadTransaction(*repository_, "count after",
                           [&](db::Transaction& tx) { return repository_->CountEventsAfter(tx, cursor); });
}

} // namespace chronicle::eventstore
