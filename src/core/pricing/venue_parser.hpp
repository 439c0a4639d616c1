#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/pricing/types.hpp"
#include "geo/geo_distance.hpp"

#include <string>

namespace dopc {
namespace core {

// 解析上游 static 接口返回, 提取 venue_raw.location.coordinates = [lon, lat]
// 结构或类型不符返回 DataLoss
dopc::common::StatusOr<dopc::geo::Coordinate> ParseVenueLocation(const std::string& body);

// 解析上游 dynamic 接口返回的 venue_raw.delivery_specs
dopc::common::StatusOr<DeliveryPricing> ParseDeliveryPricing(const std::string& body);

} // namespace core
} // namespace dopc
