#include "scheduler/backend_launcher.hpp"

#include <gtest/gtest.h>

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

using dopc::scheduler::ProcessLauncher;

namespace {

// 子进程已被回收: waitpid 不再认识该 pid
bool Reaped(pid_t pid) {
    int status = 0;
    errno = 0;
    return ::waitpid(pid, &status, WNOHANG) == -1 && errno == ECHILD;
}

} // namespace

TEST(ProcessLauncherTest, TerminateKillsAndReapsChild) {
    if (::access("/bin/sleep", X_OK) != 0) {
        GTEST_SKIP() << "/bin/sleep not available";
    }
    // 子进程命令行为: /bin/sleep 30 <port>
    ProcessLauncher launcher("/bin/sleep", "30");
    ASSERT_TRUE(launcher.Launch(1).IsOk());

    pid_t pid = launcher.PidOf(1);
    ASSERT_GT(pid, 0);
    EXPECT_EQ(::kill(pid, 0), 0);

    auto begin = std::chrono::steady_clock::now();
    launcher.Terminate(1);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(3));

    EXPECT_TRUE(Reaped(pid));
    EXPECT_EQ(launcher.PidOf(1), -1);

    // 重复终止与未知端口均为空操作
    launcher.Terminate(1);
    launcher.Terminate(4242);
}

TEST(ProcessLauncherTest, ChildIgnoringSigtermIsKilled) {
    if (::access("/bin/sh", X_OK) != 0 || ::access("/bin/sleep", X_OK) != 0) {
        GTEST_SKIP() << "/bin/sh or /bin/sleep not available";
    }
    auto script = std::filesystem::temp_directory_path() /
                  ("dopc_test_ignore_term_" + std::to_string(::getpid()) + ".sh");
    {
        std::ofstream ofs(script);
        ofs << "trap '' TERM\nexec /bin/sleep 30\n";
    }

    // 子进程命令行为: /bin/sh <script> <port>
    ProcessLauncher launcher("/bin/sh", script.string());
    ASSERT_TRUE(launcher.Launch(7).IsOk());
    pid_t pid = launcher.PidOf(7);
    ASSERT_GT(pid, 0);
    // 等脚本装好 trap
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto begin = std::chrono::steady_clock::now();
    launcher.Terminate(7);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_GE(elapsed, std::chrono::seconds(4));
    EXPECT_TRUE(Reaped(pid));

    std::error_code ec;
    std::filesystem::remove(script, ec);
}

TEST(ProcessLauncherTest, DestructorTerminatesRemainingChildren) {
    if (::access("/bin/sleep", X_OK) != 0) {
        GTEST_SKIP() << "/bin/sleep not available";
    }
    pid_t first = -1;
    pid_t second = -1;
    {
        ProcessLauncher launcher("/bin/sleep", "30");
        ASSERT_TRUE(launcher.Launch(1).IsOk());
        ASSERT_TRUE(launcher.Launch(2).IsOk());
        first = launcher.PidOf(1);
        second = launcher.PidOf(2);
    }
    EXPECT_TRUE(Reaped(first));
    EXPECT_TRUE(Reaped(second));
}
