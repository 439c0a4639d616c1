#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace dopc {
namespace common {

class ConfigLoader {
public:
    static AppConfig Load(const std::string& path);
    // 按 命令行参数 -> 环境变量 -> 默认路径 的顺序确定配置文件
    static std::string ResolvePath(int argc, char** argv);
private:
    static AppConfig FromJson(const nlohmann::json& j);
    static nlohmann::json ReadFile(const std::string& path);
};

}
}
