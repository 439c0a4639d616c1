#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

namespace dopc {
namespace registry {

// 当前通过健康检查的后端端口集合, 以及轮询游标
// 集合在两次选择之间可能增减, 游标每次按当前大小取模, 不保证跨变更的公平性
class HealthyBackendSet {
public:
    HealthyBackendSet() = default;

    // 幂等, 返回是否发生了变化
    bool Add(int port);
    bool Remove(int port);

    bool Contains(int port) const;
    std::size_t Size() const;
    std::vector<int> Snapshot() const;

    // 轮询选择下一个后端, 集合为空返回 Unavailable
    dopc::common::StatusOr<int> SelectNext();

private:
    mutable std::mutex mutex_; // 保护 ports_ 与 cursor_
    std::vector<int> ports_;
    std::size_t cursor_ = 0;
};

} // namespace registry
} // namespace dopc
