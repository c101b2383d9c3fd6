#pragma once

#include <string>
#include <chrono>
#include "rkv_core.hpp"

namespace rkv {

// 工具函数
class Utils {
public:
    // 将命令名转换为命令类型（不区分大小写）
    static CommandType stringToCommandType(const std::string& cmd);

    // 将命令类型转换为字符串
    static std::string commandTypeToString(CommandType type);

    // 获取当前墙上时钟时间（毫秒）
    static TimestampMs getCurrentTimeMs();

    // 转为大写
    static std::string toUpper(const std::string& str);

    // 不区分大小写比较
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    // 严格解析十进制整数（可带负号），整个字符串必须合法且不溢出
    static bool parseInt64(const std::string& str, int64_t& out);

    // 转义控制字符，用于日志输出
    static std::string escapeForLog(const std::string& str, size_t max_len = 64);
};

} // namespace rkv
