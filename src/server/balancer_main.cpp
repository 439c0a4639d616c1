#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "scheduler/backend_launcher.hpp"
#include "scheduler/load_balancer.hpp"
#include "server/forward_handler.hpp"
#include "server/http_server.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
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

    config.logging.file = dopc::common::ExpandLogFilePath(config.logging.file, config.server.port);
    dopc::common::InitLogger(config.logging);
    DOPC_LOG_INFO("dopc load balancer starting with config {}", config_path);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    dopc::scheduler::BalancerOptions options;
    options.host = config.server.host;
    options.num_services = config.balancer.num_services;
    options.service_port_start = config.balancer.service_port_start;
    options.endpoint = config.server.endpoint;
    options.health_check_interval = std::chrono::milliseconds(config.balancer.health_check_interval_ms);
    options.startup_delay = std::chrono::milliseconds(config.balancer.startup_delay_ms);
    options.connect_timeout = std::chrono::milliseconds(config.upstream.connect_timeout_ms);
    options.request_timeout = std::chrono::milliseconds(config.balancer.request_timeout_ms);

    auto launcher = std::make_unique<dopc::scheduler::ProcessLauncher>(config.balancer.service_binary, config_path);
    dopc::scheduler::LoadBalancer balancer(options, std::move(launcher));

    auto status = balancer.Start();
    if (!status.IsOk()) {
        DOPC_LOG_ERROR("Failed to start load balancer: {}", status.Message());
        dopc::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    dopc::server::ForwardHandler forward_handler(balancer);

    dopc::server::ServerOptions server_options;
    server_options.host = config.server.host;
    server_options.port = static_cast<std::uint16_t>(config.server.port);
    server_options.idle_timeout = std::chrono::milliseconds(config.server.idle_timeout_ms);
    server_options.thread_pool_config_path = config.thread_pool.config_path;

    dopc::server::HttpServer server(server_options);
    server.Route(config.server.endpoint, [&forward_handler](const dopc::server::HttpRequest& request) {
        return forward_handler.Handle(request);
    });

    status = server.Start();
    if (!status.IsOk()) {
        DOPC_LOG_ERROR("Failed to start HTTP server on {}:{}: {}",
                       config.server.host, config.server.port, status.Message());
        balancer.Stop();
        dopc::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    DOPC_LOG_INFO("dopc load balancer listening on {}:{}{}", config.server.host, server.Port(), config.server.endpoint);

    while (g_stop_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    DOPC_LOG_WARN("Signal {} received, shutting down load balancer...", g_stop_signal);

    server.Stop();
    balancer.Stop();
    dopc::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
