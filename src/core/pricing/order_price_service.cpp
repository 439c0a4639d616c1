#include "core/pricing/order_price_service.hpp"

#include "common/logger.hpp"
#include "core/pricing/pricing_engine.hpp"
#include "core/pricing/venue_parser.hpp"

#include <fmt/format.h>

#include <utility>

namespace dopc {
namespace core {

using dopc::common::Status;
using dopc::common::StatusOr;
using dopc::upstream::ConnectionRole;

OrderPriceService::OrderPriceService(dopc::upstream::UpstreamConnectionPool& pool,
                                     dopc::common::AdmissionGate& gate)
    : pool_(pool), gate_(gate) {}

OrderPriceService::StatusOrPrice OrderPriceService::CalculatePrice(const DeliveryOrderRequest& request) {
    // 满载时阻塞等待, 许可在所有返回路径上自动归还
    auto permit = gate_.Acquire();
    DOPC_LOG_INFO("[OrderPriceService] processing request for venue: {}", request.VenueSlug());

    auto static_body = FetchVenueData(request.VenueSlug(), ConnectionRole::kStatic);
    if (!static_body.IsOk()) {
        DOPC_LOG_ERROR("[OrderPriceService] failed to get static data: {}", static_body.GetStatus().Message());
        return static_body.GetStatus();
    }

    auto venue = ParseVenueLocation(static_body.Value());
    if (!venue.IsOk()) {
        DOPC_LOG_WARN("[OrderPriceService] invalid static data for {}: {}",
                      request.VenueSlug(), venue.GetStatus().Message());
        return venue.GetStatus();
    }

    auto dynamic_body = FetchVenueData(request.VenueSlug(), ConnectionRole::kDynamic);
    if (!dynamic_body.IsOk()) {
        DOPC_LOG_ERROR("[OrderPriceService] failed to get dynamic data: {}", dynamic_body.GetStatus().Message());
        return dynamic_body.GetStatus();
    }

    auto pricing = ParseDeliveryPricing(dynamic_body.Value());
    if (!pricing.IsOk()) {
        DOPC_LOG_WARN("[OrderPriceService] invalid dynamic data for {}: {}",
                      request.VenueSlug(), pricing.GetStatus().Message());
        return pricing.GetStatus();
    }

    auto quote = QuotePrice(request, venue.Value(), pricing.Value());
    if (!quote.IsOk()) {
        DOPC_LOG_INFO("[OrderPriceService] request for {} rejected: {}",
                      request.VenueSlug(), quote.GetStatus().Message());
    }
    return quote;
}

StatusOr<std::string> OrderPriceService::FetchVenueData(const std::string& venue_slug, ConnectionRole role) {
    auto connection = pool_.Acquire(role);
    if (!connection) {
        return Status::Unavailable("Upstream connection pool is not running");
    }
    auto reply = connection->Get(pool_.VenuePath(venue_slug, role));
    if (!reply.IsOk()) {
        return reply.GetStatus();
    }
    if (reply.Value().status != 200) {
        return Status::Unavailable(fmt::format("Request failed with status: {}", reply.Value().status));
    }
    return StatusOr<std::string>(std::move(reply.Value().body));
}

} // namespace core
} // namespace dopc
