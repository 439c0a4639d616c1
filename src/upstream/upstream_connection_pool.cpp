#include "upstream/upstream_connection_pool.hpp"

#include "common/logger.hpp"
#include "utils/url_codec.hpp"

#include <algorithm>
#include <exception>
#include <initializer_list>
#include <utility>

namespace dopc {
namespace upstream {

std::string RoleToString(ConnectionRole role) {
    switch (role) {
        case ConnectionRole::kStatic:
            return "static";
        case ConnectionRole::kDynamic:
            return "dynamic";
        default:
            return "unknown";
    }
}

UpstreamConnectionPool::UpstreamConnectionPool(PoolOptions options)
    : options_(std::move(options)) {
    options_.pool_size = std::max<std::size_t>(1, options_.pool_size);
}

UpstreamConnectionPool::~UpstreamConnectionPool() {
    Stop();
}

void UpstreamConnectionPool::Start() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        stop_requested_ = false;
    }

    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        static_slots_.slots.clear();
        dynamic_slots_.slots.clear();
        for (std::size_t i = 0; i < options_.pool_size; ++i) {
            static_slots_.slots.push_back(CreateConnection());
            dynamic_slots_.slots.push_back(CreateConnection());
        }
    }
    DOPC_LOG_INFO("[UpstreamPool] {} static and {} dynamic connections established to {}:{}",
                  options_.pool_size, options_.pool_size,
                  options_.connection.host, options_.connection.port);

    sweep_thread_ = std::thread([this]() { SweepLoop(); });
}

void UpstreamConnectionPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    sweep_cv_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }

    std::vector<ConnectionPtr> to_close;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (auto* role_slots : {&static_slots_, &dynamic_slots_}) {
            for (auto& slot : role_slots->slots) {
                to_close.push_back(std::move(slot));
            }
            role_slots->slots.clear();
        }
    }
    for (auto& connection : to_close) {
        if (connection) {
            connection->Close();
        }
    }

    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        running_ = false;
    }
    DOPC_LOG_INFO("[UpstreamPool] stopped, {} connections closed", to_close.size());
}

bool UpstreamConnectionPool::Running() const {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    return running_;
}

UpstreamConnectionPool::ConnectionPtr UpstreamConnectionPool::Acquire(ConnectionRole role) {
    auto& role_slots = SlotsFor(role);
    std::lock_guard<std::mutex> lock(slots_mutex_);
    if (role_slots.slots.empty()) {
        return nullptr;
    }
    auto index = role_slots.cursor.fetch_add(1) % role_slots.slots.size();
    return role_slots.slots[index];
}

std::size_t UpstreamConnectionPool::SweepOnce() {
    std::size_t replaced = 0;
    for (auto role : {ConnectionRole::kStatic, ConnectionRole::kDynamic}) {
        auto& role_slots = SlotsFor(role);
        for (std::size_t i = 0; i < options_.pool_size; ++i) {
            if (StopRequested()) {
                return replaced;
            }
            ConnectionPtr connection;
            {
                std::lock_guard<std::mutex> lock(slots_mutex_);
                if (i >= role_slots.slots.size()) {
                    break;
                }
                connection = role_slots.slots[i];
            }
            if (ProbeSlot(connection, role)) {
                continue;
            }
            DOPC_LOG_WARN("[UpstreamPool] replacing unhealthy {} connection {}", RoleToString(role), i);
            ReplaceSlot(role, i, connection);
            ++replaced;
        }
    }
    return replaced;
}

std::string UpstreamConnectionPool::VenuePath(const std::string& venue_slug, ConnectionRole role) const {
    return options_.base_path + "/venues/" + dopc::utils::PercentEncode(venue_slug) + "/" + RoleToString(role);
}

UpstreamConnectionPool::RoleSlots& UpstreamConnectionPool::SlotsFor(ConnectionRole role) {
    return role == ConnectionRole::kStatic ? static_slots_ : dynamic_slots_;
}

UpstreamConnectionPool::ConnectionPtr UpstreamConnectionPool::CreateConnection() const {
    return std::make_shared<dopc::client::HttpConnection>(options_.connection);
}

bool UpstreamConnectionPool::ProbeSlot(const ConnectionPtr& connection, ConnectionRole role) {
    if (!connection) {
        return false;
    }
    auto reply = connection->Get(VenuePath(options_.probe_venue_slug, role));
    if (!reply.IsOk()) {
        DOPC_LOG_WARN("[UpstreamPool] health check failed for {} connection: {}",
                      RoleToString(role), reply.GetStatus().Message());
        return false;
    }
    if (!reply.Value().IsSuccess()) {
        DOPC_LOG_WARN("[UpstreamPool] health check for {} connection returned {}",
                      RoleToString(role), reply.Value().status);
        return false;
    }
    return true;
}

void UpstreamConnectionPool::ReplaceSlot(ConnectionRole role, std::size_t index, const ConnectionPtr& stale) {
    auto fresh = CreateConnection();
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto& role_slots = SlotsFor(role);
        // Stop 期间槽位可能已被清空
        if (index >= role_slots.slots.size() || role_slots.slots[index] != stale) {
            return;
        }
        role_slots.slots[index] = fresh;
    }
    // 旧连接在锁外关闭, 进行中的请求持有 shared_ptr 不受影响
    if (stale) {
        stale->Close();
    }
    replacements_.fetch_add(1);
    DOPC_LOG_INFO("[UpstreamPool] replaced {} connection at index {}", RoleToString(role), index);
}

void UpstreamConnectionPool::SweepLoop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!stop_requested_) {
        lock.unlock();
        auto interval = options_.health_check_interval;
        try {
            SweepOnce();
        } catch (const std::exception& ex) {
            DOPC_LOG_ERROR("[UpstreamPool] error in connection monitoring: {}", ex.what());
            interval = std::min(interval, std::chrono::milliseconds(5000));
        }
        lock.lock();
        sweep_cv_.wait_for(lock, interval, [this]() { return stop_requested_; });
    }
    DOPC_LOG_INFO("[UpstreamPool] health monitoring stopped");
}

bool UpstreamConnectionPool::StopRequested() const {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    return stop_requested_;
}

} // namespace upstream
} // namespace dopc
