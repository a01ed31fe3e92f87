#include "position_store.hpp"

#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chronicle::projection {

namespace {

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw util::StorageError(result.code, prefix + ": " + result.message);
  }
}

template <typename Fn>
auto InTransaction(db::Repository& repo, const std::string& op, Fn&& fn) {
  try {
    auto tx = repo.Begin();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, db::Transaction&>>) {
      fn(*tx);
      tx->Commit();
    } else {
      auto result = fn(*tx);
      tx->Commit();
      return result;
    }
  } catch (const db::DbError& e) {
    throw util::StorageError(e.code(), op + ": " + e.what());
  }
}

} // namespace

ProjectionPositionStore::ProjectionPositionStore(std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)) {
}

std::optional<db::model::ProjectionPositionRecord> ProjectionPositionStore::Get(const std::string& projection_name) const {
  return InTransaction(*repository_, "get position " + projection_name,
                       [&](db::Transaction& tx) { return repository_->GetProjectionPosition(tx, projection_name); });
}

void ProjectionPositionStore::Advance(const std::string& projection_name, const db::model::EventRecord& event) {
  InTransaction(*repository_, "advance position " + projection_name, [&](db::Transaction& tx) {
    ThrowIfError(repository_->AdvanceProjectionPosition(tx, projection_name, event.event_id, event.global_sequence,
                                                        util::NowMillis()),
                 "advance position " + projection_name);
  });
}

void ProjectionPositionStore::Delete(const std::string& projection_name) {
  InTransaction(*repository_, "delete position " + projection_name, [&](db::Transaction& tx) {
    ThrowIfError(repository_->DeleteProjectionPosition(tx, projection_name), "delete position " + projection_name);
  });
}

std::vector<db::model::ProjectionPositionRecord> ProjectionPositionStore::List() const {
  return InTransaction(*repository_, "list positions",
                       [&](db::Transaction& tx) { return repository_->ListProjectionPositions(tx); });
}

} // namespace chronicle::projection
