#include "server/price_handler.hpp"

#include "common/logger.hpp"
#include "core/pricing/errors.hpp"
#include "utils/url_codec.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>
#include <system_error>
#include <vector>

namespace dopc {
namespace server {

using dopc::common::Status;
using dopc::common::StatusOr;

namespace {

constexpr std::array<const char*, 4> kRequiredParams{"venue_slug", "cart_value", "user_lat", "user_lon"};

StatusOr<std::int64_t> ParseInteger(const std::string& name, const std::string& text) {
    std::int64_t value = 0;
    auto first = text.data();
    auto last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return Status::InvalidArgument(name + " must be an integer, got '" + text + "'");
    }
    return StatusOr<std::int64_t>(value);
}

StatusOr<double> ParseDouble(const std::string& name, const std::string& text) {
    if (text.empty()) {
        return Status::InvalidArgument(name + " must be a number");
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return Status::InvalidArgument(name + " must be a number, got '" + text + "'");
    }
    return StatusOr<double>(value);
}

} // namespace

PriceHandler::PriceHandler(dopc::core::OrderPriceService& service) : service_(service) {}

HttpResponse PriceHandler::Handle(const HttpRequest& request) {
    auto params = dopc::utils::ParseQuery(request.query);
    DOPC_LOG_INFO("[PriceHandler] received request with query: {}", request.query);

    auto order = ParseRequest(params);
    if (!order.IsOk()) {
        DOPC_LOG_WARN("[PriceHandler] {}", order.GetStatus().Message());
        return JsonError(400, order.GetStatus().Message());
    }

    auto price = service_.CalculatePrice(order.Value());
    if (!price.IsOk()) {
        auto code = dopc::core::MapStatus(price.GetStatus());
        DOPC_LOG_WARN("[PriceHandler] pricing failed ({}): {}",
                      dopc::core::PriceErrorCodeToString(code), price.GetStatus().Message());
        return JsonError(dopc::core::ToHttpStatus(code), price.GetStatus().Message());
    }

    HttpResponse response;
    response.body = ToJson(price.Value());
    return response;
}

StatusOr<dopc::core::DeliveryOrderRequest> PriceHandler::ParseRequest(
    const std::map<std::string, std::string>& params) {
    // 先统一检查缺失参数
    std::vector<std::string> missing;
    for (const char* name : kRequiredParams) {
        if (params.find(name) == params.end()) {
            missing.emplace_back(name);
        }
    }
    if (!missing.empty()) {
        std::string message = "Missing required parameters: ";
        for (std::size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) {
                message += ", ";
            }
            message += missing[i];
        }
        return Status::InvalidArgument(message);
    }

    auto cart_value = ParseInteger("cart_value", params.at("cart_value"));
    if (!cart_value.IsOk()) {
        return Status::InvalidArgument("Validation error: " + cart_value.GetStatus().Message());
    }
    auto user_lat = ParseDouble("user_lat", params.at("user_lat"));
    if (!user_lat.IsOk()) {
        return Status::InvalidArgument("Validation error: " + user_lat.GetStatus().Message());
    }
    auto user_lon = ParseDouble("user_lon", params.at("user_lon"));
    if (!user_lon.IsOk()) {
        return Status::InvalidArgument("Validation error: " + user_lon.GetStatus().Message());
    }

    auto order = dopc::core::DeliveryOrderRequest::Create(params.at("venue_slug"), cart_value.Value(),
                                                          user_lat.Value(), user_lon.Value());
    if (!order.IsOk()) {
        return Status::InvalidArgument("Validation error: " + order.GetStatus().Message());
    }
    return order;
}

std::string PriceHandler::ToJson(const dopc::core::DeliveryPriceResponse& response) {
    nlohmann::json body = {
        {"total_price", response.TotalPrice()},
        {"small_order_surcharge", response.SmallOrderSurcharge()},
        {"cart_value", response.CartValue()},
        {"delivery", {
            {"fee", response.Delivery().fee},
            {"distance", response.Delivery().distance},
        }},
    };
    return body.dump();
}

} // namespace server
} // namespace dopc
