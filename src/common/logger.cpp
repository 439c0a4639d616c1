#include "common/logger.hpp"

#include <thread_pool/thread_pool.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <vector>

namespace dopc {
namespace common {

namespace {

// 通过 std::atomic_load / std::atomic_store 访问
std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_default_once;

void LogLevelFallback(const std::string& level,
                      std::string_view reason,
                      spdlog::level::level_enum fallback) noexcept {
    std::fprintf(stderr,
                 "dopc logger: invalid level \"%s\" (%s); fallback to %s\n",
                 level.c_str(),
                 std::string(reason).c_str(),
                 spdlog::level::to_string_view(fallback).data());
}

spdlog::level::level_enum SafeParseLevel(
    const std::string& level, spdlog::level::level_enum fallback) noexcept {
    std::string normalized = level;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (normalized == "warning") {
        normalized = "warn";
    } else if (normalized == "error") {
        normalized = "err";
    }

    static constexpr std::array<std::string_view, 7> kValidLevels{
        "trace", "debug", "info", "warn", "err", "critical", "off"};

    auto it = std::find(kValidLevels.begin(), kValidLevels.end(), normalized);
    if (it == kValidLevels.end()) {
        LogLevelFallback(level, "not recognized", fallback);
        return fallback;
    }

    try {
        return spdlog::level::from_str(normalized);
    } catch (const spdlog::spdlog_ex& ex) {
        LogLevelFallback(level, ex.what(), fallback);
        return fallback;
    }
}

void EnsureParentDirectory(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory " + parent.string() + ": " + ec.message());
    }
}

} // namespace

void InitLogger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file.empty()) {
        std::filesystem::path log_path{config.file};
        EnsureParentDirectory(log_path);
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true));
    }
    auto logger = std::make_shared<spdlog::logger>("dopc", sinks.begin(), sinks.end());
    logger->set_level(SafeParseLevel(config.level, spdlog::level::info));
    logger->set_pattern(config.pattern);
    spdlog::set_default_logger(logger);
    std::atomic_store(&g_logger, logger);

    if (config.integrate_thread_pool_logger) {
        thread_pool::log::SetLogger(logger);
    }
}

void ShutdownLogger() {
    if (auto logger = std::atomic_load(&g_logger)) {
        logger->flush();
    }
    spdlog::shutdown();
}

std::string ExpandLogFilePath(const std::string& path, int port) {
    static constexpr std::string_view kPlaceholder = "{port}";
    std::string result = path;
    auto pos = result.find(kPlaceholder);
    while (pos != std::string::npos) {
        auto port_str = std::to_string(port);
        result.replace(pos, kPlaceholder.size(), port_str);
        pos = result.find(kPlaceholder, pos + port_str.size());
    }
    return result;
}

std::shared_ptr<spdlog::logger> GetLogger() {
    // 未调用 InitLogger 时退回 spdlog 默认日志器, 只初始化一次
    std::call_once(g_default_once, []() {
        if (!std::atomic_load(&g_logger)) {
            std::atomic_store(&g_logger, spdlog::default_logger());
        }
    });
    return std::atomic_load(&g_logger);
}

}
}
