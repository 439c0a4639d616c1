#include "server/health_service.h"

#include <nlohmann/json.hpp>

namespace dopc::server {

HttpResponse HealthService::Check(const HttpRequest& /*request*/) const {
    HttpResponse response;
    response.body = nlohmann::json{{"status", "healthy"}}.dump();
    return response;
}

}
