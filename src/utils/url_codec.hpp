#pragma once

#include <map>
#include <string>
#include <string_view>

namespace dopc {
namespace utils {

// 百分号解码, '+' 视为空格; 非法转义原样保留
std::string PercentDecode(std::string_view input);

// 对路径段做百分号编码, 仅保留 RFC 3986 非保留字符
std::string PercentEncode(std::string_view input);

// 解析 a=1&b=2 形式的查询串, 重复键保留第一个值
std::map<std::string, std::string> ParseQuery(std::string_view query);

// 将请求目标拆分为路径和查询串
void SplitTarget(std::string_view target, std::string* path, std::string* query);

} // namespace utils
} // namespace dopc
