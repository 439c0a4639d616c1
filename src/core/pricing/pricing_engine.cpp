#include "core/pricing/pricing_engine.hpp"

#include <fmt/format.h>

namespace dopc {
namespace core {

using dopc::common::Status;
using dopc::common::StatusOr;

namespace {

// 向下取整除法, 负数时与整数截断除法不同
std::int64_t FloorDiv(std::int64_t numerator, std::int64_t denominator) {
    std::int64_t quotient = numerator / denominator;
    if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
        --quotient;
    }
    return quotient;
}

} // namespace

StatusOr<std::int64_t> DeliveryFee(std::int64_t distance, const DeliveryPricing& pricing) {
    for (const auto& range : pricing.distance_ranges) {
        if (range.max == 0) {
            if (distance >= range.min) {
                return Status::OutOfRange(fmt::format(
                    "Delivery distance {}m exceeds maximum allowed distance {}m", distance, range.min));
            }
            continue;
        }
        if (range.min <= distance && distance <= range.max) {
            // 上游数值不受控, 溢出视为上游数据非法
            std::int64_t per_distance = 0;
            std::int64_t fee = 0;
            if (__builtin_mul_overflow(range.b, distance, &per_distance) ||
                __builtin_add_overflow(pricing.base_price, range.a, &fee) ||
                __builtin_add_overflow(fee, FloorDiv(per_distance, 10), &fee)) {
                return Status::DataLoss(fmt::format(
                    "Delivery pricing for distance {}m overflows the fee range", distance));
            }
            if (fee <= 0) {
                return Status::DataLoss(fmt::format("Delivery pricing yields non-positive fee {} for distance {}m",
                                                    fee, distance));
            }
            return StatusOr<std::int64_t>(fee);
        }
    }
    return Status::NotFound(fmt::format("No suitable delivery fee range found for distance {}m", distance));
}

std::int64_t SmallOrderSurcharge(std::int64_t cart_value, std::int64_t order_minimum) {
    if (cart_value < order_minimum) {
        return order_minimum - cart_value;
    }
    return 0;
}

StatusOr<std::int64_t> TotalPrice(std::int64_t cart_value, std::int64_t fee, std::int64_t surcharge) {
    std::int64_t total = 0;
    if (__builtin_add_overflow(cart_value, fee, &total) || __builtin_add_overflow(total, surcharge, &total)) {
        return Status::InvalidArgument("Total price exceeds the representable range");
    }
    return StatusOr<std::int64_t>(total);
}

StatusOr<DeliveryPriceResponse> QuotePrice(const DeliveryOrderRequest& request,
                                           const dopc::geo::Coordinate& venue,
                                           const DeliveryPricing& pricing) {
    const std::int64_t distance = dopc::geo::DistanceMeters(
        dopc::geo::Coordinate{request.UserLat(), request.UserLon()}, venue);

    auto fee = DeliveryFee(distance, pricing);
    if (!fee.IsOk()) {
        return fee.GetStatus();
    }
    const std::int64_t surcharge = SmallOrderSurcharge(request.CartValue(), pricing.order_minimum_no_surcharge);
    auto total = TotalPrice(request.CartValue(), fee.Value(), surcharge);
    if (!total.IsOk()) {
        return total.GetStatus();
    }

    return DeliveryPriceResponse::Create(total.Value(), surcharge, request.CartValue(),
                                         DeliveryDetails{fee.Value(), distance});
}

} // namespace core
} // namespace dopc
