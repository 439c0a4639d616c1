#pragma once

#include "common/status_or.hpp"
#include "core/pricing/order_price_service.hpp"
#include "core/pricing/types.hpp"
#include "server/http_server.hpp"

#include <map>
#include <string>

namespace dopc {
namespace server {

// 询价接口: 解析查询参数, 调用定价流水线, 将结果映射为 JSON 与 HTTP 状态码
class PriceHandler {
public:
    explicit PriceHandler(dopc::core::OrderPriceService& service);

    HttpResponse Handle(const HttpRequest& request);

    // 缺参或参数非法时返回 InvalidArgument, 不发起任何网络请求
    static dopc::common::StatusOr<dopc::core::DeliveryOrderRequest> ParseRequest(
        const std::map<std::string, std::string>& params);

    static std::string ToJson(const dopc::core::DeliveryPriceResponse& response);

private:
    dopc::core::OrderPriceService& service_;
};

} // namespace server
} // namespace dopc
