#include "core/pricing/types.hpp"

#include "geo/geo_distance.hpp"

#include <utility>

namespace dopc {
namespace core {

using dopc::common::Status;
using dopc::common::StatusOr;

StatusOr<DeliveryOrderRequest> DeliveryOrderRequest::Create(std::string venue_slug,
                                                           std::int64_t cart_value,
                                                           double user_lat,
                                                           double user_lon) {
    if (venue_slug.empty()) {
        return Status::InvalidArgument("Venue slug must be a non-empty string");
    }
    if (cart_value <= 0) {
        return Status::InvalidArgument("Cart value must be greater than 0");
    }
    auto coord_status = dopc::geo::ValidateCoordinates(user_lat, user_lon);
    if (!coord_status.IsOk()) {
        return coord_status;
    }
    return StatusOr<DeliveryOrderRequest>(
        DeliveryOrderRequest(std::move(venue_slug), cart_value, user_lat, user_lon));
}

StatusOr<DeliveryPriceResponse> DeliveryPriceResponse::Create(std::int64_t total_price,
                                                             std::int64_t small_order_surcharge,
                                                             std::int64_t cart_value,
                                                             DeliveryDetails delivery) {
    if (cart_value <= 0) {
        return Status::InvalidArgument("Cart value must be greater than 0");
    }
    if (small_order_surcharge < 0) {
        return Status::InvalidArgument("Small order surcharge cannot be negative");
    }
    if (delivery.fee <= 0) {
        return Status::InvalidArgument("Delivery fee must be greater than 0");
    }
    if (delivery.fee > kMaxDeliveryFee) {
        return Status::InvalidArgument("Delivery fee exceeds maximum allowed value");
    }
    if (delivery.distance <= 0) {
        return Status::InvalidArgument("Distance must be greater than 0");
    }
    if (delivery.distance > kMaxDistanceMeters) {
        return Status::InvalidArgument("Distance exceeds maximum allowed value");
    }
    if (total_price <= 0) {
        return Status::InvalidArgument("Total price must be greater than 0");
    }
    std::int64_t expected = 0;
    if (__builtin_add_overflow(cart_value, delivery.fee, &expected) ||
        __builtin_add_overflow(expected, small_order_surcharge, &expected) ||
        total_price != expected) {
        return Status::Internal("Total price does not match component sum");
    }

    DeliveryPriceResponse response;
    response.total_price_ = total_price;
    response.small_order_surcharge_ = small_order_surcharge;
    response.cart_value_ = cart_value;
    response.delivery_ = delivery;
    return StatusOr<DeliveryPriceResponse>(std::move(response));
}

} // namespace core
} // namespace dopc
