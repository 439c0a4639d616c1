#pragma once

#include "common/admission_gate.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/pricing/types.hpp"
#include "upstream/upstream_connection_pool.hpp"

#include <string>

namespace dopc {
namespace core {

// 单次询价流水线: 准入 -> 拉取 static -> 解析坐标 -> 拉取 dynamic -> 计算报价
class OrderPriceService {
public:
    using StatusOrPrice = dopc::common::StatusOr<DeliveryPriceResponse>;

    OrderPriceService(dopc::upstream::UpstreamConnectionPool& pool, dopc::common::AdmissionGate& gate);

    // 返回报价或遇到的第一个错误, 错误分类见 core/pricing/errors.hpp
    StatusOrPrice CalculatePrice(const DeliveryOrderRequest& request);

private:
    dopc::common::StatusOr<std::string> FetchVenueData(const std::string& venue_slug,
                                                       dopc::upstream::ConnectionRole role);

private:
    dopc::upstream::UpstreamConnectionPool& pool_;
    dopc::common::AdmissionGate& gate_;
};

} // namespace core
} // namespace dopc
