#pragma once

#include "client/http_connection.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "registry/healthy_backend_set.hpp"
#include "scheduler/backend_launcher.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dopc {
namespace scheduler {

enum class InstanceState {
    kStarting = 0,
    kHealthy,
    kUnhealthy,
};

std::string InstanceStateToString(InstanceState state);

struct BalancerOptions {
    std::string host = "127.0.0.1";
    int num_services = 3;
    int service_port_start = 8001;
    std::string endpoint = "/api/v1/delivery-order-price";
    std::chrono::milliseconds health_check_interval{5000};
    std::chrono::milliseconds startup_delay{2000};
    std::chrono::milliseconds connect_timeout{2000};
    std::chrono::milliseconds request_timeout{5000};
};

// 后端实例, 由 LoadBalancer 独占
struct ServiceInstance {
    int port = 0;
    InstanceState state = InstanceState::kStarting;
    std::chrono::system_clock::time_point last_checked;
    std::shared_ptr<dopc::client::HttpConnection> connection;
};

// 负载均衡器
// 启动 N 个定价服务实例, 周期性探活维护健康集合, 按轮询把询价请求转发到健康实例
class LoadBalancer {
public:
    LoadBalancer(BalancerOptions options, std::unique_ptr<BackendLauncher> launcher);
    ~LoadBalancer();

    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    // 启动全部实例, 等待 startup_delay 后全部乐观标记为健康并启动探活线程
    // 所有实例都启动失败时返回 Unavailable
    dopc::common::Status Start();
    // 停止探活, 关闭连接并终止实例, 可重复调用
    void Stop();

    // 执行一轮探活
    void CheckHealthOnce();

    // 健康集合为空返回 Unavailable
    dopc::common::StatusOr<int> SelectNext();

    // 把原始查询串转发到选中的实例, 原样返回状态码和响应体
    // 无健康实例返回 Unavailable, 传输失败返回 Internal
    dopc::common::StatusOr<dopc::client::HttpReply> Forward(const std::string& raw_query);

    std::vector<int> HealthyPorts() const { return healthy_.Snapshot(); }
    std::optional<InstanceState> StateOf(int port) const;
    std::size_t InstanceCount() const;

private:
    std::shared_ptr<dopc::client::HttpConnection> ConnectionFor(int port) const;
    bool ProbeInstance(const std::shared_ptr<dopc::client::HttpConnection>& connection, int port);
    void UpdateState(int port, InstanceState state);
    void HealthLoop();
    // 可被 Stop 打断的等待, 返回 false 表示已请求停止
    bool WaitFor(std::chrono::milliseconds duration);

private:
    BalancerOptions options_;
    std::unique_ptr<BackendLauncher> launcher_;

    mutable std::mutex instances_mutex_; // 保护实例状态与时间戳
    std::vector<ServiceInstance> instances_;

    dopc::registry::HealthyBackendSet healthy_;

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool stop_requested_ = false;
    bool running_ = false;
    std::thread health_thread_;
};

} // namespace scheduler
} // namespace dopc
