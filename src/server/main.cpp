#include "common/admission_gate.hpp"
#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "core/pricing/order_price_service.hpp"
#include "server/health_service.h"
#include "server/http_server.hpp"
#include "server/price_handler.hpp"
#include "upstream/upstream_connection_pool.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

// 解析命令行端口参数, 非法返回 -1
int ParsePort(const char* text) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value <= 0 || value > 65535) {
        return -1;
    }
    return static_cast<int>(value);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = dopc::common::ConfigLoader::ResolvePath(argc, argv);

    dopc::common::AppConfig config;
    try {
        config = dopc::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    // 负载均衡器以 <config_path> <port> 启动实例
    if (argc > 2) {
        int port = ParsePort(argv[2]);
        if (port < 0) {
            std::fprintf(stderr, "Invalid port argument: %s\n", argv[2]);
            return EXIT_FAILURE;
        }
        config.server.port = port;
    }

    config.logging.file = dopc::common::ExpandLogFilePath(config.logging.file, config.server.port);
    dopc::common::InitLogger(config.logging);
    DOPC_LOG_INFO("dopc service starting with config {} on port {}", config_path, config.server.port);

    dopc::upstream::PoolOptions pool_options;
    pool_options.connection.host = config.upstream.host;
    pool_options.connection.port = static_cast<std::uint16_t>(config.upstream.port);
    pool_options.connection.connect_timeout = std::chrono::milliseconds(config.upstream.connect_timeout_ms);
    pool_options.connection.request_timeout = std::chrono::milliseconds(config.upstream.request_timeout_ms);
    pool_options.base_path = config.upstream.base_path;
    pool_options.pool_size = static_cast<std::size_t>(config.upstream.pool_size);
    pool_options.health_check_interval = std::chrono::milliseconds(config.upstream.health_check_interval_ms);
    pool_options.probe_venue_slug = config.upstream.probe_venue_slug;

    dopc::upstream::UpstreamConnectionPool pool(pool_options);
    pool.Start();

    dopc::common::AdmissionGate gate(static_cast<std::size_t>(config.service.max_concurrent_requests));
    dopc::core::OrderPriceService service(pool, gate);
    dopc::server::PriceHandler price_handler(service);
    dopc::server::HealthService health_service;

    dopc::server::ServerOptions server_options;
    server_options.host = config.server.host;
    server_options.port = static_cast<std::uint16_t>(config.server.port);
    server_options.idle_timeout = std::chrono::milliseconds(config.server.idle_timeout_ms);
    server_options.thread_pool_config_path = config.thread_pool.config_path;

    dopc::server::HttpServer server(server_options);
    server.Route(config.server.endpoint, [&price_handler](const dopc::server::HttpRequest& request) {
        return price_handler.Handle(request);
    });
    server.Route(dopc::server::HealthService::kPath, [&health_service](const dopc::server::HttpRequest& request) {
        return health_service.Check(request);
    });

    auto status = server.Start();
    if (!status.IsOk()) {
        DOPC_LOG_ERROR("Failed to start HTTP server on {}:{}: {}",
                       config.server.host, config.server.port, status.Message());
        pool.Stop();
        dopc::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    DOPC_LOG_INFO("dopc service listening on {}:{}{}", config.server.host, server.Port(), config.server.endpoint);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    while (g_stop_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    DOPC_LOG_WARN("Signal {} received, shutting down dopc service...", g_stop_signal);

    server.Stop();
    pool.Stop();
    DOPC_LOG_INFO("dopc service on port {} stopped", config.server.port);
    dopc::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
