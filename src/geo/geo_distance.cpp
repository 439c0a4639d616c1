#include "geo/geo_distance.hpp"

#include <fmt/format.h>

#include <cmath>

namespace dopc {
namespace geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double ToRadians(double degrees) {
    return degrees * kPi / 180.0;
}

} // namespace

dopc::common::Status ValidateCoordinates(double latitude, double longitude) {
    if (!std::isfinite(latitude) || !std::isfinite(longitude)) {
        return dopc::common::Status::InvalidArgument("Coordinates must be numeric");
    }
    if (latitude < -90.0 || latitude > 90.0) {
        return dopc::common::Status::InvalidArgument(
            fmt::format("Invalid latitude: {}. Must be between -90 and 90", latitude));
    }
    if (longitude < -180.0 || longitude > 180.0) {
        return dopc::common::Status::InvalidArgument(
            fmt::format("Invalid longitude: {}. Must be between -180 and 180", longitude));
    }
    return dopc::common::Status::OK();
}

std::int64_t DistanceMeters(const Coordinate& from, const Coordinate& to) {
    const double lat1 = ToRadians(from.latitude);
    const double lat2 = ToRadians(to.latitude);
    const double dlat = lat2 - lat1;
    const double dlon = ToRadians(to.longitude) - ToRadians(from.longitude);

    const double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
    const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    // nearbyint 使用默认舍入模式 (半数取偶)
    return static_cast<std::int64_t>(std::nearbyint(kEarthRadiusMeters * c));
}

} // namespace geo
} // namespace dopc
