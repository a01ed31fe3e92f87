#pragma once

#include <memory>
#include <string>

#include "internal/projection/projector.hpp"
#include "product_catalog.hpp"

namespace chronicle::projection {
class ProjectionPositionStore;
}

namespace chronicle::readmodel {

/*
  Feeds ProductCatalog from Product* events.

  An event whose aggregate_version is not newer than the stored product is
  skipped, so replays leave the catalog unchanged. Events for a product
  that was never created are logged and skipped. Unknown event types are
  ignored.
*/
class ProductProjector : public projection::Projector {
 public:
  static constexpr const char* kName = "ProductReadModel";

  ProductProjector(std::shared_ptr<ProductCatalog> catalog, std::shared_ptr<projection::ProjectionPositionStore> positions,
                   std::string name = kName);

  std::string Name() const override {
    return name_;
  }

  void Apply(const db::model::EventRecord& event) override;

  void Reset() override;

  db::model::ProjectionPositionRecord CurrentPosition() const override;

 private:
  void OnCreated(const db::model::EventRecord& event);

  template <typename Mutate>
  void OnChanged(const db::model::EventRecord& event, Mutate&& mutate);

  std::shared_ptr<ProductCatalog>                      catalog_;
  std::shared_ptr<projection::ProjectionPositionStore> positions_;
  std::string                                          name_;
};

} // namespace chronicle::readmodel
