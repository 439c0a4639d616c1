#pragma once

#include <string>

namespace dopc {
namespace common {

// 服务器配置结构体
struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 8000;
    std::string endpoint = "/api/v1/delivery-order-price";
    int idle_timeout_ms = 30000; // keep-alive 连接空闲超时
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = ""; // 支持 {port} 占位符, 每个实例单独一个日志文件
    bool integrate_thread_pool_logger = false;
};

// 线程池配置路径结构体
struct ThreadPoolConfigPath {
    std::string config_path = "config/thread_pool.json";
};

// 上游场馆数据 API 配置
struct UpstreamConfig {
    std::string host = "127.0.0.1";
    int port = 10000;
    std::string base_path = "/home-assignment-api/v1";
    int pool_size = 5;
    int health_check_interval_ms = 30000;
    std::string probe_venue_slug = "home-assignment-venue-helsinki";
    int connect_timeout_ms = 2000;
    int request_timeout_ms = 30000;
};

// 单实例定价服务配置
struct ServiceConfig {
    int max_concurrent_requests = 100; // 准入信号量容量
};

// 负载均衡器配置
struct BalancerConfig {
    int num_services = 3;
    int service_port_start = 8001;
    int health_check_interval_ms = 5000;
    int startup_delay_ms = 2000;
    int request_timeout_ms = 5000;
    std::string service_binary = "./dopc_server";
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    ThreadPoolConfigPath thread_pool;
    UpstreamConfig upstream;
    ServiceConfig service;
    BalancerConfig balancer;
};

}
}
