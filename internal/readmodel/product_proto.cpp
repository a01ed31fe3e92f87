#include "product_proto.hpp"

#include "internal/util/time.hpp"

namespace chronicle::readmodel {

chronicle::v1::Product ToProto(const ProductView& product) {
  chronicle::v1::Product out;
  out.set_id(product.id);
  out.set_sku(product.sku);
  out.set_name(product.name);
  out.set_description(product.description);
  out.set_price_cents(product.price_cents);
  out.set_price_display(product.price_display);
  out.set_status(product.status);
  out.set_version(product.aggregate_version);
  out.set_last_event_id(product.last_event_id);
  *out.mutable_created_at() = util::ToProto(util::FromUnixMillis(product.created_at_ms));
  *out.mutable_updated_at() = util::ToProto(util::FromUnixMillis(product.updated_at_ms));
  out.set_deleted(product.deleted);
  return out;
}

chronicle::v1::ProductPage ToProto(const std::vector<ProductView>& products, uint64_t total) {
  chronicle::v1::ProductPage out;
  for (const auto& p : products)
    *out.add_products() = ToProto(p);
  out.set_total(total);
  return out;
}

} // namespace chronicle::readmodel
