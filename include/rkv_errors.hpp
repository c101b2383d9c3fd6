#pragma once

#include <stdexcept>
#include <string>

namespace rkv {

// 所有RKV错误的基类
class RKVError : public std::runtime_error {
public:
    explicit RKVError(const std::string& message) : std::runtime_error(message) {}
};

// 缓冲区数据不足，需要继续读取后重试（不是用户可见的错误）
class IncompleteInput : public RKVError {
public:
    explicit IncompleteInput(const std::string& message = "incomplete input") : RKVError(message) {}
};

// 帧格式错误
class ProtocolError : public RKVError {
public:
    explicit ProtocolError(const std::string& message) : RKVError(message) {}
};

// 命令结构错误（根不是数组、空数组、元素不是字符串）
class CommandError : public RKVError {
public:
    explicit CommandError(const std::string& message) : RKVError(message) {}
};

// 已知命令的参数数量或类型错误
class ArgumentError : public RKVError {
public:
    explicit ArgumentError(const std::string& message) : RKVError(message) {}
};

// 未知命令
class UnknownCommandError : public RKVError {
public:
    explicit UnknownCommandError(const std::string& message) : RKVError(message) {}
};

} // namespace rkv
