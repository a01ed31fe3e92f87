#include "product_projector.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/projection/position_store.hpp"
#include "internal/util/errors.hpp"

namespace chronicle::readmodel {

namespace {

using chronicle::observability::IntField;
using chronicle::observability::StringField;

google::protobuf::Struct ParsePayload(const db::model::EventRecord& event) {
  google::protobuf::Struct payload;
  if (event.payload.empty()) return payload;

  auto status = google::protobuf::util::JsonStringToMessage(event.payload, &payload);
  if (!status.ok()) {
    throw util::ValidationError("event " + event.event_id + " has a malformed payload: " + std::string(status.message()));
  }
  return payload;
}

std::string StringValue(const google::protobuf::Struct& payload, const std::string& key) {
  auto it = payload.fields().find(key);
  if (it == payload.fields().end() || !it->second.has_string_value()) return {};
  return it->second.string_value();
}

int64_t CentsValue(const google::protobuf::Struct& payload, const std::string& key) {
  auto it = payload.fields().find(key);
  if (it == payload.fields().end() || !it->second.has_number_value()) return 0;
  return static_cast<int64_t>(std::llround(it->second.number_value()));
}

} // namespace

ProductProjector::ProductProjector(std::shared_ptr<ProductCatalog>                      catalog,
                                   std::shared_ptr<projection::ProjectionPositionStore> positions, std::string name)
    : catalog_(std::move(catalog)), positions_(std::move(positions)), name_(std::move(name)) {
}

void ProductProjector::Apply(const db::model::EventRecord& event) {
  CHRONICLE_LOG_DEBUG("projecting product event", {StringField("event_type", event.event_type), StringField("product_id", event.aggregate_id),
                                                   IntField("version", static_cast<int64_t>(event.aggregate_version))});

  const auto& type = event.event_type;

  if (type == "ProductCreated") {
    OnCreated(event);
  } else if (type == "ProductUpdated") {
    OnChanged(event, [](ProductView& product, const google::protobuf::Struct& payload) {
      product.name        = StringValue(payload, "name");
      product.description = StringValue(payload, "description");
      product.search_text = BuildSearchText(product.name, product.description);
    });
  } else if (type == "ProductPriceChanged") {
    OnChanged(event, [](ProductView& product, const google::protobuf::Struct& payload) {
      product.price_cents   = CentsValue(payload, "newPriceCents");
      product.price_display = FormatPrice(product.price_cents);
    });
  } else if (type == "ProductActivated") {
    OnChanged(event, [](ProductView& product, const google::protobuf::Struct&) { product.status = "ACTIVE"; });
  } else if (type == "ProductDiscontinued") {
    OnChanged(event, [](ProductView& product, const google::protobuf::Struct&) { product.status = "DISCONTINUED"; });
  } else if (type == "ProductDeleted") {
    OnChanged(event, [](ProductView& product, const google::protobuf::Struct&) { product.deleted = true; });
  }
}

void ProductProjector::OnCreated(const db::model::EventRecord& event) {
  if (auto existing = catalog_->Get(event.aggregate_id); existing && existing->aggregate_version >= event.aggregate_version) {
    return;
  }

  const auto payload = ParsePayload(event);

  ProductView product;
  product.id                = event.aggregate_id;
  product.sku               = StringValue(payload, "sku");
  product.name              = StringValue(payload, "name");
  product.description       = StringValue(payload, "description");
  product.price_cents       = CentsValue(payload, "priceCents");
  product.price_display     = FormatPrice(product.price_cents);
  product.status            = StringValue(payload, "status");
  product.search_text       = BuildSearchText(product.name, product.description);
  product.aggregate_version = event.aggregate_version;
  product.last_event_id     = event.event_id;
  product.created_at_ms     = event.occurred_at_ms;
  product.updated_at_ms     = event.occurred_at_ms;

  if (product.status.empty()) product.status = "DRAFT";

  catalog_->Put(product);
  CHRONICLE_LOG_INFO("product created", {StringField("product_id", product.id), StringField("sku", product.sku)});
}

template <typename Mutate>
void ProductProjector::OnChanged(const db::model::EventRecord& event, Mutate&& mutate) {
  auto product = catalog_->Get(event.aggregate_id);
  if (!product) {
    CHRONICLE_LOG_WARN("product not found", {StringField("event_type", event.event_type), StringField("product_id", event.aggregate_id)});
    return;
  }

  if (product->aggregate_version >= event.aggregate_version) {
    CHRONICLE_LOG_DEBUG("skipping already projected event", {StringField("product_id", event.aggregate_id),
                                                             IntField("version", static_cast<int64_t>(event.aggregate_version))});
    return;
  }

  mutate(*product, ParsePayload(event));

  product->aggregate_version = event.aggregate_version;
  product->last_event_id     = event.event_id;
  product->updated_at_ms     = event.occurred_at_ms;
  catalog_->Put(*product);
}

void ProductProjector::Reset() {
  catalog_->Clear();
}

db::model::ProjectionPositionRecord ProductProjector::CurrentPosition() const {
  if (auto position = positions_->Get(name_)) return *position;

  db::model::ProjectionPositionRecord empty;
  empty.projection_name = name_;
  return empty;
}

} // namespace chronicle::readmodel
