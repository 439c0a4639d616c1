#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace dopc {
namespace common {

namespace {

// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("DOPC_SERVER_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

constexpr int kMaxPort = 65535;

bool IsValidPort(int port) {
    return port >= 1 && port <= kMaxPort;
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

std::string ConfigLoader::ResolvePath(int argc, char** argv) {
    if (argc > 1) {
        return argv[1];
    }
    return DetectConfigPath();
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Server配置
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
        cfg.server.endpoint = server.value("endpoint", cfg.server.endpoint);
        cfg.server.idle_timeout_ms = server.value("idle_timeout_ms", cfg.server.idle_timeout_ms);
    }
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
        cfg.logging.integrate_thread_pool_logger =
            logging.value("integrate_thread_pool_logger", cfg.logging.integrate_thread_pool_logger);
    }
    // ThreadPool配置
    if (j.contains("thread_pool")) {
        cfg.thread_pool.config_path = j["thread_pool"].value("config_path", cfg.thread_pool.config_path);
    }
    // Upstream配置
    if (j.contains("upstream")) {
        const auto& upstream = j["upstream"];
        cfg.upstream.host = upstream.value("host", cfg.upstream.host);
        cfg.upstream.port = upstream.value("port", cfg.upstream.port);
        cfg.upstream.base_path = upstream.value("base_path", cfg.upstream.base_path);
        cfg.upstream.pool_size = upstream.value("pool_size", cfg.upstream.pool_size);
        cfg.upstream.health_check_interval_ms =
            upstream.value("health_check_interval_ms", cfg.upstream.health_check_interval_ms);
        cfg.upstream.probe_venue_slug = upstream.value("probe_venue_slug", cfg.upstream.probe_venue_slug);
        cfg.upstream.connect_timeout_ms = upstream.value("connect_timeout_ms", cfg.upstream.connect_timeout_ms);
        cfg.upstream.request_timeout_ms = upstream.value("request_timeout_ms", cfg.upstream.request_timeout_ms);
    }
    // Service配置
    if (j.contains("service")) {
        cfg.service.max_concurrent_requests =
            j["service"].value("max_concurrent_requests", cfg.service.max_concurrent_requests);
    }
    // Balancer配置
    if (j.contains("balancer")) {
        const auto& balancer = j["balancer"];
        cfg.balancer.num_services = balancer.value("num_services", cfg.balancer.num_services);
        cfg.balancer.service_port_start = balancer.value("service_port_start", cfg.balancer.service_port_start);
        cfg.balancer.health_check_interval_ms =
            balancer.value("health_check_interval_ms", cfg.balancer.health_check_interval_ms);
        cfg.balancer.startup_delay_ms = balancer.value("startup_delay_ms", cfg.balancer.startup_delay_ms);
        cfg.balancer.request_timeout_ms = balancer.value("request_timeout_ms", cfg.balancer.request_timeout_ms);
        cfg.balancer.service_binary = balancer.value("service_binary", cfg.balancer.service_binary);
    }

    if (cfg.upstream.pool_size <= 0) {
        throw std::runtime_error("upstream.pool_size must be positive");
    }
    if (cfg.service.max_concurrent_requests <= 0) {
        throw std::runtime_error("service.max_concurrent_requests must be positive");
    }
    if (cfg.balancer.num_services <= 0) {
        throw std::runtime_error("balancer.num_services must be positive");
    }
    // 端口最终转为 uint16_t, 越界会静默回绕
    if (!IsValidPort(cfg.server.port)) {
        throw std::runtime_error("server.port must be in [1, 65535]");
    }
    if (!IsValidPort(cfg.upstream.port)) {
        throw std::runtime_error("upstream.port must be in [1, 65535]");
    }
    if (!IsValidPort(cfg.balancer.service_port_start) ||
        cfg.balancer.num_services > kMaxPort - cfg.balancer.service_port_start + 1) {
        throw std::runtime_error("balancer.service_port_start + num_services - 1 must be in [1, 65535]");
    }
    return cfg;
}

}
}
