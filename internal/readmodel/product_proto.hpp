#pragma once

#include <cstdint>
#include <vector>

#include "chronicle/v1/admin.pb.h"
#include "product_catalog.hpp"

namespace chronicle::readmodel {

chronicle::v1::Product     ToProto(const ProductView& product);
chronicle::v1::ProductPage ToProto(const std::vector<ProductView>& products, uint64_t total);

} // namespace chronicle::readmodel
