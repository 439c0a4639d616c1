#include "scheduler/backend_launcher.hpp"

#include "common/logger.hpp"

#include <fmt/format.h>

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>
#include <vector>

namespace dopc {
namespace scheduler {

namespace {

constexpr auto kTerminateGrace = std::chrono::seconds(5);

// 等待子进程退出, 超时返回 false
bool WaitForExit(pid_t pid, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid || (rc < 0 && errno == ECHILD)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

} // namespace

ProcessLauncher::ProcessLauncher(std::string binary, std::string config_path)
    : binary_(std::move(binary)), config_path_(std::move(config_path)) {}

ProcessLauncher::~ProcessLauncher() {
    std::vector<int> ports;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : processes_) {
            ports.push_back(entry.first);
        }
    }
    for (int port : ports) {
        Terminate(port);
    }
}

dopc::common::Status ProcessLauncher::Launch(int port) {
    // fork 之后子进程只调用 async-signal-safe 函数, 参数与错误信息提前准备
    std::string port_arg = std::to_string(port);
    std::vector<char*> argv{const_cast<char*>(binary_.c_str()),
                            const_cast<char*>(config_path_.c_str()),
                            const_cast<char*>(port_arg.c_str()),
                            nullptr};
    const std::string exec_error = "execv " + binary_ + " failed\n";

    pid_t pid = ::fork();
    if (pid < 0) {
        return dopc::common::Status::Internal(fmt::format("fork failed: {}", std::strerror(errno)));
    }
    if (pid == 0) {
        ::execv(binary_.c_str(), argv.data());
        ssize_t written = ::write(STDERR_FILENO, exec_error.data(), exec_error.size());
        (void)written;
        ::_exit(127);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        processes_[port] = pid;
    }
    DOPC_LOG_INFO("[ProcessLauncher] started dopc service on port {} (pid {})", port, pid);
    return dopc::common::Status::OK();
}

pid_t ProcessLauncher::PidOf(int port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(port);
    return it == processes_.end() ? -1 : it->second;
}

void ProcessLauncher::Terminate(int port) {
    pid_t pid = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(port);
        if (it == processes_.end()) {
            return;
        }
        pid = it->second;
        processes_.erase(it);
    }

    if (::kill(pid, SIGTERM) != 0 && errno != ESRCH) {
        DOPC_LOG_WARN("[ProcessLauncher] SIGTERM to pid {} failed: {}", pid, std::strerror(errno));
    }
    if (!WaitForExit(pid, kTerminateGrace)) {
        DOPC_LOG_WARN("[ProcessLauncher] pid {} did not exit, sending SIGKILL", pid);
        ::kill(pid, SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);
    }
    DOPC_LOG_INFO("[ProcessLauncher] dopc service on port {} terminated", port);
}

} // namespace scheduler
} // namespace dopc
