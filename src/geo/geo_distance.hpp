#pragma once

#include "common/status.hpp"

#include <cstdint>

namespace dopc {
namespace geo {

// 地球半径 (米)
constexpr double kEarthRadiusMeters = 6371000.0;

struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;
};

// 校验经纬度范围: 纬度 [-90, 90], 经度 [-180, 180]
dopc::common::Status ValidateCoordinates(double latitude, double longitude);

// Haversine 大圆距离, 四舍五入到整米 (与 Python round 一致, 半数取偶)
std::int64_t DistanceMeters(const Coordinate& from, const Coordinate& to);

} // namespace geo
} // namespace dopc
