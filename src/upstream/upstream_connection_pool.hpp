#pragma once

#include "client/http_connection.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dopc {
namespace upstream {

// 连接角色: static 拉取场馆坐标, dynamic 拉取定价规格
enum class ConnectionRole {
    kStatic = 0,
    kDynamic,
};

std::string RoleToString(ConnectionRole role);

struct PoolOptions {
    dopc::client::ConnectionOptions connection;
    std::string base_path = "/home-assignment-api/v1";
    std::size_t pool_size = 5;
    std::chrono::milliseconds health_check_interval{30000};
    std::string probe_venue_slug = "home-assignment-venue-helsinki";
};

// 上游长连接池
// 每个角色固定数量的槽位, 轮询取用, 不借出也不归还
// 后台巡检线程定期探测每个槽位, 失败则原地替换
class UpstreamConnectionPool {
public:
    using ConnectionPtr = std::shared_ptr<dopc::client::HttpConnection>;

    explicit UpstreamConnectionPool(PoolOptions options);
    ~UpstreamConnectionPool();

    UpstreamConnectionPool(const UpstreamConnectionPool&) = delete;
    UpstreamConnectionPool& operator=(const UpstreamConnectionPool&) = delete;

    // 创建全部槽位并启动巡检线程
    void Start();
    // 停止巡检并关闭全部连接, 可重复调用
    void Stop();
    bool Running() const;

    // 轮询取下一个槽位, 不做同步健康检查; 未启动时返回 nullptr
    ConnectionPtr Acquire(ConnectionRole role);

    // 执行一轮巡检, 返回本轮替换的槽位数
    std::size_t SweepOnce();

    // 场馆数据路径, 如 /home-assignment-api/v1/venues/{slug}/static
    std::string VenuePath(const std::string& venue_slug, ConnectionRole role) const;

    std::size_t Size() const noexcept { return options_.pool_size; }
    std::size_t Replacements() const noexcept { return replacements_.load(); }

private:
    struct RoleSlots {
        std::vector<ConnectionPtr> slots;
        std::atomic<std::size_t> cursor{0};
    };

    RoleSlots& SlotsFor(ConnectionRole role);
    ConnectionPtr CreateConnection() const;
    bool ProbeSlot(const ConnectionPtr& connection, ConnectionRole role);
    void ReplaceSlot(ConnectionRole role, std::size_t index, const ConnectionPtr& stale);
    void SweepLoop();
    bool StopRequested() const;

private:
    PoolOptions options_;

    mutable std::mutex slots_mutex_; // 保护两组槽位数组
    RoleSlots static_slots_;
    RoleSlots dynamic_slots_;

    mutable std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool stop_requested_ = false;
    bool running_ = false;
    std::thread sweep_thread_;

    std::atomic<std::size_t> replacements_{0};
};

} // namespace upstream
} // namespace dopc
