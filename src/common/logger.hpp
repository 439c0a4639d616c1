#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace dopc {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 将日志文件路径中的 {port} 替换为实例端口
std::string ExpandLogFilePath(const std::string& path, int port);

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define DOPC_LOG_DEBUG(...) ::dopc::common::GetLogger()->debug(__VA_ARGS__)
#define DOPC_LOG_INFO(...)  ::dopc::common::GetLogger()->info(__VA_ARGS__)
#define DOPC_LOG_WARN(...)  ::dopc::common::GetLogger()->warn(__VA_ARGS__)
#define DOPC_LOG_ERROR(...) ::dopc::common::GetLogger()->error(__VA_ARGS__)

}
}
