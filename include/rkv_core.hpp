#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>

namespace rkv {

// 基础类型定义
using Key = std::string;
using Value = std::string;
// 自Unix纪元起的毫秒数（墙上时钟，非单调）
using TimestampMs = int64_t;

// 命令类型枚举
enum class CommandType {
    UNKNOWN = -1,
    PING = 0,
    ECHO = 1,
    SET = 2,
    GET = 3
};

// 响应状态枚举
enum class ResponseStatus {
    OK = 0,         // 简单字符串
    ERROR = 1,      // 错误行
    NOT_FOUND = 2,  // 空批量字符串
    BULK = 3        // 批量字符串
};

// 命令结构
struct Command {
    CommandType type;
    std::string name;               // 客户端发送的原始命令名
    std::vector<std::string> args;

    Command() : type(CommandType::UNKNOWN) {}
    Command(CommandType t, const std::string& n, const std::vector<std::string>& a)
        : type(t), name(n), args(a) {}
};

// 响应结构
struct Response {
    ResponseStatus status;
    std::string message;
    std::string data;

    Response() : status(ResponseStatus::OK) {}
    Response(ResponseStatus s, const std::string& m = "", const std::string& d = "")
        : status(s), message(m), data(d) {}
};

} // namespace rkv

#include "rkv_utils.hpp"
