#include "scheduler/load_balancer.hpp"

#include "common/logger.hpp"

#include <exception>
#include <utility>

namespace dopc {
namespace scheduler {

std::string InstanceStateToString(InstanceState state) {
    switch (state) {
        case InstanceState::kStarting:
            return "starting";
        case InstanceState::kHealthy:
            return "healthy";
        case InstanceState::kUnhealthy:
            return "unhealthy";
        default:
            return "unknown";
    }
}

LoadBalancer::LoadBalancer(BalancerOptions options, std::unique_ptr<BackendLauncher> launcher)
    : options_(std::move(options)), launcher_(std::move(launcher)) {}

LoadBalancer::~LoadBalancer() {
    Stop();
}

dopc::common::Status LoadBalancer::Start() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        if (running_) {
            return dopc::common::Status::FailedPrecondition("Load balancer already started");
        }
        running_ = true;
        stop_requested_ = false;
    }

    std::vector<int> launched;
    for (int i = 0; i < options_.num_services; ++i) {
        ServiceInstance instance;
        instance.port = options_.service_port_start + i;

        auto status = launcher_->Launch(instance.port);
        if (!status.IsOk()) {
            DOPC_LOG_ERROR("[LoadBalancer] failed to start service on port {}: {}",
                           instance.port, status.Message());
            instance.state = InstanceState::kUnhealthy;
        } else {
            dopc::client::ConnectionOptions connection;
            connection.host = options_.host;
            connection.port = static_cast<std::uint16_t>(instance.port);
            connection.connect_timeout = options_.connect_timeout;
            connection.request_timeout = options_.request_timeout;
            instance.connection = std::make_shared<dopc::client::HttpConnection>(connection);
            launched.push_back(instance.port);
        }

        std::lock_guard<std::mutex> lock(instances_mutex_);
        instances_.push_back(std::move(instance));
    }

    if (launched.empty()) {
        DOPC_LOG_ERROR("[LoadBalancer] no service instance could be started");
        Stop();
        return dopc::common::Status::Unavailable("No service instance could be started");
    }

    if (!WaitFor(options_.startup_delay)) {
        return dopc::common::Status::Unavailable("Load balancer stopped during startup");
    }

    // 启动等待结束后先乐观地视为健康, 由探活线程纠正
    for (int port : launched) {
        UpdateState(port, InstanceState::kHealthy);
        healthy_.Add(port);
    }
    DOPC_LOG_INFO("[LoadBalancer] {} of {} services started, first port {}",
                  launched.size(), options_.num_services, options_.service_port_start);

    health_thread_ = std::thread([this]() { HealthLoop(); });
    return dopc::common::Status::OK();
}

void LoadBalancer::Stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    loop_cv_.notify_all();
    if (health_thread_.joinable()) {
        health_thread_.join();
    }

    std::vector<ServiceInstance> instances;
    {
        std::lock_guard<std::mutex> lock(instances_mutex_);
        instances.swap(instances_);
    }
    for (auto& instance : instances) {
        healthy_.Remove(instance.port);
        if (instance.connection) {
            instance.connection->Close();
        }
        launcher_->Terminate(instance.port);
    }

    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        running_ = false;
    }
    DOPC_LOG_INFO("[LoadBalancer] stopped, {} services terminated", instances.size());
}

void LoadBalancer::CheckHealthOnce() {
    std::vector<std::pair<int, std::shared_ptr<dopc::client::HttpConnection>>> targets;
    {
        std::lock_guard<std::mutex> lock(instances_mutex_);
        for (const auto& instance : instances_) {
            if (instance.connection) {
                targets.emplace_back(instance.port, instance.connection);
            }
        }
    }

    for (const auto& target : targets) {
        const int port = target.first;
        if (ProbeInstance(target.second, port)) {
            if (healthy_.Add(port)) {
                DOPC_LOG_INFO("[LoadBalancer] service on port {} is healthy again", port);
            }
            UpdateState(port, InstanceState::kHealthy);
        } else {
            if (healthy_.Remove(port)) {
                DOPC_LOG_WARN("[LoadBalancer] service on port {} removed from rotation", port);
            }
            UpdateState(port, InstanceState::kUnhealthy);
        }
    }
}

dopc::common::StatusOr<int> LoadBalancer::SelectNext() {
    return healthy_.SelectNext();
}

dopc::common::StatusOr<dopc::client::HttpReply> LoadBalancer::Forward(const std::string& raw_query) {
    auto selected = SelectNext();
    if (!selected.IsOk()) {
        return selected.GetStatus();
    }
    const int port = selected.Value();

    auto connection = ConnectionFor(port);
    if (!connection) {
        return dopc::common::Status::Internal("Load balancer error: no connection for port " + std::to_string(port));
    }

    std::string target = options_.endpoint;
    if (!raw_query.empty()) {
        target += "?" + raw_query;
    }

    auto reply = connection->Get(target);
    if (!reply.IsOk()) {
        DOPC_LOG_ERROR("[LoadBalancer] forwarding to port {} failed: {}", port, reply.GetStatus().Message());
        return dopc::common::Status::Internal("Load balancer error: " + reply.GetStatus().Message());
    }
    return reply;
}

std::optional<InstanceState> LoadBalancer::StateOf(int port) const {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    for (const auto& instance : instances_) {
        if (instance.port == port) {
            return instance.state;
        }
    }
    return std::nullopt;
}

std::size_t LoadBalancer::InstanceCount() const {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    return instances_.size();
}

std::shared_ptr<dopc::client::HttpConnection> LoadBalancer::ConnectionFor(int port) const {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    for (const auto& instance : instances_) {
        if (instance.port == port) {
            return instance.connection;
        }
    }
    return nullptr;
}

bool LoadBalancer::ProbeInstance(const std::shared_ptr<dopc::client::HttpConnection>& connection, int port) {
    auto reply = connection->Get("/health");
    if (!reply.IsOk()) {
        DOPC_LOG_WARN("[LoadBalancer] health check failed for service on port {}: {}",
                      port, reply.GetStatus().Message());
        return false;
    }
    if (reply.Value().status != 200) {
        DOPC_LOG_WARN("[LoadBalancer] health check for service on port {} returned {}",
                      port, reply.Value().status);
        return false;
    }
    return true;
}

void LoadBalancer::UpdateState(int port, InstanceState state) {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    for (auto& instance : instances_) {
        if (instance.port == port) {
            if (instance.state != state) {
                DOPC_LOG_INFO("[LoadBalancer] service on port {}: {} -> {}", port,
                              InstanceStateToString(instance.state), InstanceStateToString(state));
            }
            instance.state = state;
            instance.last_checked = std::chrono::system_clock::now();
            return;
        }
    }
}

void LoadBalancer::HealthLoop() {
    do {
        try {
            CheckHealthOnce();
        } catch (const std::exception& ex) {
            DOPC_LOG_ERROR("[LoadBalancer] error in health check loop: {}", ex.what());
        }
    } while (WaitFor(options_.health_check_interval));
    DOPC_LOG_INFO("[LoadBalancer] health check loop stopped");
}

bool LoadBalancer::WaitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(loop_mutex_);
    return !loop_cv_.wait_for(lock, duration, [this]() { return stop_requested_; });
}

} // namespace scheduler
} // namespace dopc
