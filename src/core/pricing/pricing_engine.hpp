#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/pricing/types.hpp"
#include "geo/geo_distance.hpp"

#include <cstdint>

namespace dopc {
namespace core {

// 按区间顺序查找配送费
// 超出最大配送距离返回 OutOfRange, 无匹配区间返回 NotFound, 费用计算溢出返回 DataLoss
dopc::common::StatusOr<std::int64_t> DeliveryFee(std::int64_t distance, const DeliveryPricing& pricing);

// 小额订单附加费: max(0, order_minimum - cart_value)
std::int64_t SmallOrderSurcharge(std::int64_t cart_value, std::int64_t order_minimum);

// 各组成部分之和, 溢出返回 InvalidArgument
dopc::common::StatusOr<std::int64_t> TotalPrice(std::int64_t cart_value, std::int64_t fee, std::int64_t surcharge);

// 组合距离、配送费、附加费得到完整报价
dopc::common::StatusOr<DeliveryPriceResponse> QuotePrice(const DeliveryOrderRequest& request,
                                                        const dopc::geo::Coordinate& venue,
                                                        const DeliveryPricing& pricing);

} // namespace core
} // namespace dopc
