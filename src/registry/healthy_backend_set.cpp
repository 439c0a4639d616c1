#include "registry/healthy_backend_set.hpp"

#include <algorithm>

namespace dopc {
namespace registry {

bool HealthyBackendSet::Add(int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(ports_.begin(), ports_.end(), port) != ports_.end()) {
        return false;
    }
    ports_.push_back(port);
    return true;
}

bool HealthyBackendSet::Remove(int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(ports_.begin(), ports_.end(), port);
    if (it == ports_.end()) {
        return false;
    }
    ports_.erase(it);
    return true;
}

bool HealthyBackendSet::Contains(int port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(ports_.begin(), ports_.end(), port) != ports_.end();
}

std::size_t HealthyBackendSet::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ports_.size();
}

std::vector<int> HealthyBackendSet::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ports_;
}

dopc::common::StatusOr<int> HealthyBackendSet::SelectNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ports_.empty()) {
        return dopc::common::Status::Unavailable("No healthy services available");
    }
    // 集合可能已缩小, 先按当前大小重新解释游标
    const std::size_t index = cursor_ % ports_.size();
    cursor_ = (index + 1) % ports_.size();
    return dopc::common::StatusOr<int>(ports_[index]);
}

} // namespace registry
} // namespace dopc
