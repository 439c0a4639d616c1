#pragma once

#include "common/status.hpp"

#include <sys/types.h>

#include <map>
#include <mutex>
#include <string>

namespace dopc {
namespace scheduler {

// 后端实例的启动与终止
class BackendLauncher {
public:
    virtual ~BackendLauncher() = default;

    // 在指定端口上启动一个定价服务实例
    virtual dopc::common::Status Launch(int port) = 0;
    // 终止实例并回收资源, 未启动的端口忽略
    virtual void Terminate(int port) = 0;
};

// 以独立进程方式运行实例: <binary> <config_path> <port>
class ProcessLauncher : public BackendLauncher {
public:
    ProcessLauncher(std::string binary, std::string config_path);
    ~ProcessLauncher() override;

    dopc::common::Status Launch(int port) override;
    void Terminate(int port) override;

    // 端口对应的子进程, 未启动或已终止返回 -1
    pid_t PidOf(int port) const;

private:
    std::string binary_;
    std::string config_path_;
    mutable std::mutex mutex_;
    std::map<int, pid_t> processes_; // 端口 -> 子进程
};

} // namespace scheduler
} // namespace dopc
