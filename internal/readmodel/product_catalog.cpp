#include "product_catalog.hpp"

#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace chronicle::readmodel {

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

ProductCatalog::ProductCatalog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void ProductCatalog::Put(const ProductView& product) {
  InTransaction(*repository_, "put product " + product.id, [&](db::Transaction& tx) {
    ThrowIfError(repository_->UpsertProduct(tx, product), "put product " + product.id);
  });
}

// ------------------------------------------------------------
// Lookups
// ------------------------------------------------------------

std::optional<ProductView> ProductCatalog::Get(const std::string& id) const {
  return InTransaction(*repository_, "get product " + id,
                       [&](db::Transaction& tx) { return repository_->GetProduct(tx, id); });
}

std::optional<ProductView> ProductCatalog::FindBySku(const std::string& sku) const {
  return InTransaction(*repository_, "get product by sku " + sku,
                       [&](db::Transaction& tx) { return repository_->GetProductBySku(tx, sku); });
}

std::vector<ProductView> ProductCatalog::List(bool include_deleted) const {
  db::model::ProductQuery query;
  query.include_deleted = include_deleted;
  return Query(query);
}

std::vector<ProductView> ProductCatalog::ListByStatus(const std::string& status, uint64_t limit, uint64_t offset) const {
  db::model::ProductQuery query;
  query.status = status;
  query.limit  = limit;
  query.offset = offset;
  return Query(query);
}

std::vector<ProductView> ProductCatalog::ListByPriceRange(int64_t min_cents, int64_t max_cents, uint64_t limit) const {
  if (min_cents > max_cents) {
    throw util::ValidationError("price range is empty: " + std::to_string(min_cents) + " > " + std::to_string(max_cents));
  }

  db::model::ProductQuery query;
  query.min_price_cents = min_cents;
  query.max_price_cents = max_cents;
  query.sort            = db::model::ProductSort::kPriceAsc;
  query.limit           = limit;
  return Query(query);
}

std::vector<ProductView> ProductCatalog::Search(const std::string& term, uint64_t limit) const {
  db::model::ProductQuery query;
  query.search = term;
  query.limit  = limit;
  return Query(query);
}

std::vector<ProductView> ProductCatalog::Query(const db::model::ProductQuery& query) const {
  return InTransaction(*repository_, "query products",
                       [&](db::Transaction& tx) { return repository_->QueryProducts(tx, query); });
}

uint64_t ProductCatalog::Count(const db::model::ProductQuery& query) const {
  return InTransaction(*repository_, "count products",
                       [&](db::Transaction& tx) { return repository_->CountProducts(tx, query); });
}

// ------------------------------------------------------------
// Clear
// ------------------------------------------------------------

void ProductCatalog::Clear() {
  InTransaction(*repository_, "clear products",
                [&](db::Transaction& tx) { ThrowIfError(repository_->DeleteAllProducts(tx), "clear products"); });
}

size_t ProductCatalog::Size() const {
  db::model::ProductQuery query;
  query.include_deleted = true;
  return static_cast<size_t>(Count(query));
}

std::string FormatPrice(int64_t cents) {
  const bool    negative = cents < 0;
  const int64_t abs      = negative ? -cents : cents;

  std::string remainder = std::to_string(abs % 100);
  if (remainder.size() < 2) remainder.insert(0, "0");

  return std::string(negative ? "-$" : "$") + std::to_string(abs / 100) + "." + remainder;
}

std::string BuildSearchText(const std::string& name, const std::string& description) {
  if (description.empty()) return name;
  return name + " " + description;
}

} // namespace chronicle::readmodel
