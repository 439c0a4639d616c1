#include "server/forward_handler.hpp"

#include "common/logger.hpp"

#include <utility>

namespace dopc {
namespace server {

ForwardHandler::ForwardHandler(dopc::scheduler::LoadBalancer& balancer) : balancer_(balancer) {}

HttpResponse ForwardHandler::Handle(const HttpRequest& request) {
    auto reply = balancer_.Forward(request.query);
    if (!reply.IsOk()) {
        const auto& status = reply.GetStatus();
        if (status.Code() == dopc::common::StatusCode::kUnavailable) {
            DOPC_LOG_ERROR("[ForwardHandler] {}", status.Message());
            return JsonError(503, status.Message());
        }
        return JsonError(500, status.Message());
    }

    HttpResponse response;
    response.status = reply.Value().status;
    response.body = std::move(reply.Value().body);
    if (!reply.Value().content_type.empty()) {
        response.content_type = reply.Value().content_type;
    }
    return response;
}

} // namespace server
} // namespace dopc
