#pragma once

#include "server/http_server.hpp"

namespace dopc::server {

// GET /health, 供负载均衡器探活
class HealthService {
public:
    static constexpr const char* kPath = "/health";

    HttpResponse Check(const HttpRequest& request) const;
};

}
