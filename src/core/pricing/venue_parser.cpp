#include "core/pricing/venue_parser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <utility>

namespace dopc {
namespace core {

using dopc::common::Status;
using dopc::common::StatusOr;
using nlohmann::json;

namespace {

// 按路径逐层取对象, 任一层缺失或不是对象则返回 nullptr
const json* FindObject(const json& root, std::initializer_list<const char*> path) {
    const json* node = &root;
    for (const char* key : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node->is_object() ? node : nullptr;
}

Status ReadInteger(const json& object, const char* key, std::int64_t* out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Status::DataLoss(std::string("Missing ") + key + " in delivery specs");
    }
    if (!it->is_number_integer()) {
        return Status::DataLoss(std::string("Field ") + key + " must be an integer");
    }
    *out = it->get<std::int64_t>();
    return Status::OK();
}

StatusOr<json> ParseBody(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return Status::DataLoss("Upstream response is not valid JSON");
    }
    return StatusOr<json>(std::move(parsed));
}

} // namespace

StatusOr<dopc::geo::Coordinate> ParseVenueLocation(const std::string& body) {
    auto parsed = ParseBody(body);
    if (!parsed.IsOk()) {
        return parsed.GetStatus();
    }
    const json& root = parsed.Value();

    if (!FindObject(root, {"venue_raw"})) {
        return Status::DataLoss("Missing venue_raw in static data");
    }
    const json* location = FindObject(root, {"venue_raw", "location"});
    if (!location) {
        return Status::DataLoss("Missing location in venue_raw");
    }
    auto coords = location->find("coordinates");
    if (coords == location->end() || !coords->is_array() || coords->size() != 2 ||
        !(*coords)[0].is_number() || !(*coords)[1].is_number()) {
        return Status::DataLoss("Invalid or missing coordinates");
    }

    // 上游坐标顺序为 [经度, 纬度]
    dopc::geo::Coordinate venue;
    venue.longitude = (*coords)[0].get<double>();
    venue.latitude = (*coords)[1].get<double>();

    auto valid = dopc::geo::ValidateCoordinates(venue.latitude, venue.longitude);
    if (!valid.IsOk()) {
        return Status::DataLoss("Venue " + valid.Message());
    }
    return StatusOr<dopc::geo::Coordinate>(venue);
}

StatusOr<DeliveryPricing> ParseDeliveryPricing(const std::string& body) {
    auto parsed = ParseBody(body);
    if (!parsed.IsOk()) {
        return parsed.GetStatus();
    }
    const json* specs = FindObject(parsed.Value(), {"venue_raw", "delivery_specs"});
    if (!specs) {
        return Status::DataLoss("Missing venue_raw.delivery_specs in dynamic data");
    }
    auto pricing_it = specs->find("delivery_pricing");
    if (pricing_it == specs->end() || !pricing_it->is_object()) {
        return Status::DataLoss("Missing delivery_pricing in delivery specs");
    }

    DeliveryPricing pricing;
    auto status = ReadInteger(*pricing_it, "base_price", &pricing.base_price);
    if (!status.IsOk()) {
        return status;
    }
    status = ReadInteger(*specs, "order_minimum_no_surcharge", &pricing.order_minimum_no_surcharge);
    if (!status.IsOk()) {
        return status;
    }

    auto ranges = pricing_it->find("distance_ranges");
    if (ranges == pricing_it->end() || !ranges->is_array()) {
        return Status::DataLoss("Missing distance_ranges in delivery pricing");
    }
    pricing.distance_ranges.reserve(ranges->size());
    for (const auto& item : *ranges) {
        if (!item.is_object()) {
            return Status::DataLoss("Distance range must be an object");
        }
        DistanceRange range;
        for (const auto& field : {std::make_pair("min", &range.min), std::make_pair("max", &range.max),
                                  std::make_pair("a", &range.a), std::make_pair("b", &range.b)}) {
            status = ReadInteger(item, field.first, field.second);
            if (!status.IsOk()) {
                return status;
            }
        }
        pricing.distance_ranges.push_back(range);
    }
    return StatusOr<DeliveryPricing>(std::move(pricing));
}

} // namespace core
} // namespace dopc
