#pragma once

#include "scheduler/load_balancer.hpp"
#include "server/http_server.hpp"

namespace dopc {
namespace server {

// 负载均衡器对外的询价接口, 把查询串原样转交给后端实例
class ForwardHandler {
public:
    explicit ForwardHandler(dopc::scheduler::LoadBalancer& balancer);

    // 后端响应原样返回; 无健康实例 503, 转发失败 500
    HttpResponse Handle(const HttpRequest& request);

private:
    dopc::scheduler::LoadBalancer& balancer_;
};

} // namespace server
} // namespace dopc
