#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dopc {
namespace core {

// 客户端下单询价请求, 构造后不可变
class DeliveryOrderRequest {
public:
    DeliveryOrderRequest() = default;

    // 校验后构造, 任一字段非法返回 InvalidArgument
    static dopc::common::StatusOr<DeliveryOrderRequest> Create(std::string venue_slug,
                                                              std::int64_t cart_value,
                                                              double user_lat,
                                                              double user_lon);

    const std::string& VenueSlug() const { return venue_slug_; }
    std::int64_t CartValue() const { return cart_value_; }
    double UserLat() const { return user_lat_; }
    double UserLon() const { return user_lon_; }

private:
    DeliveryOrderRequest(std::string venue_slug, std::int64_t cart_value, double user_lat, double user_lon)
        : venue_slug_(std::move(venue_slug)), cart_value_(cart_value), user_lat_(user_lat), user_lon_(user_lon) {}

    std::string venue_slug_;
    std::int64_t cart_value_ = 0; // 货币最小单位
    double user_lat_ = 0.0;
    double user_lon_ = 0.0;
};

// 距离区间: [min, max] 米, 费用 = a + floor(b * distance / 10)
struct DistanceRange {
    std::int64_t min = 0;
    std::int64_t max = 0; // 0 表示超过 min 即拒绝配送
    std::int64_t a = 0;
    std::int64_t b = 0;
};

// 场馆动态定价规格
struct DeliveryPricing {
    std::int64_t base_price = 0;
    std::vector<DistanceRange> distance_ranges;
    std::int64_t order_minimum_no_surcharge = 0;
};

struct DeliveryDetails {
    std::int64_t fee = 0;      // 配送费
    std::int64_t distance = 0; // 距离 (米)
};

// 询价结果, total_price 必须等于各组成部分之和
class DeliveryPriceResponse {
public:
    static constexpr std::int64_t kMaxDeliveryFee = 1500000;
    static constexpr std::int64_t kMaxDistanceMeters = 2000000;

    DeliveryPriceResponse() = default;

    // 构造时校验取值范围与求和不变式, 不会悄悄重新计算
    static dopc::common::StatusOr<DeliveryPriceResponse> Create(std::int64_t total_price,
                                                               std::int64_t small_order_surcharge,
                                                               std::int64_t cart_value,
                                                               DeliveryDetails delivery);

    std::int64_t TotalPrice() const { return total_price_; }
    std::int64_t SmallOrderSurcharge() const { return small_order_surcharge_; }
    std::int64_t CartValue() const { return cart_value_; }
    const DeliveryDetails& Delivery() const { return delivery_; }

private:
    std::int64_t total_price_ = 0;
    std::int64_t small_order_surcharge_ = 0;
    std::int64_t cart_value_ = 0;
    DeliveryDetails delivery_;
};

} // namespace core
} // namespace dopc
