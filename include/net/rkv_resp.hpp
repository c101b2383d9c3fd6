#pragma once

#include "../rkv_core.hpp"
#include "../rkv_errors.hpp"
#include <string>
#include <utility>
#include <vector>

namespace rkv {

// RESP协议类型
enum class RESPType {
    SIMPLE_STRING = '+',  // +
    ERROR = '-',          // -
    INTEGER = ':',        // :
    BULK_STRING = '$',    // $
    ARRAY = '*'           // *
};

// 解析后的协议元素，只有SIMPLE_STRING、BULK_STRING、ARRAY三种会被解码出来
struct RESPValue {
    RESPType type;
    std::string str;
    std::vector<RESPValue> elements;

    RESPValue() : type(RESPType::SIMPLE_STRING) {}

    static RESPValue simpleString(const std::string& s);
    static RESPValue bulkString(const std::string& s);
    static RESPValue array(std::vector<RESPValue> items);

    bool isString() const {
        return type == RESPType::SIMPLE_STRING || type == RESPType::BULK_STRING;
    }

    bool operator==(const RESPValue& other) const;
    bool operator!=(const RESPValue& other) const { return !(*this == other); }
};

// RESP协议编解码器
class RESPProtocol {
public:
    // 单个批量字符串的最大长度（512MB）
    static constexpr int64_t MAX_BULK_LENGTH = 512LL * 1024 * 1024;
    // 单个数组的最大元素个数
    static constexpr int64_t MAX_ARRAY_LENGTH = 1024LL * 1024;
    // 数组最大嵌套层数
    static constexpr int MAX_NESTING_DEPTH = 32;

    // 从pos开始解码一个完整元素，返回元素和消耗的字节数
    // 数据不足时抛出IncompleteInput，格式错误时抛出ProtocolError
    static std::pair<RESPValue, size_t> decode(const std::string& data, size_t pos = 0);

    // 把顶层数组解释为命令，失败时抛出CommandError
    static Command toCommand(const RESPValue& value);

    // 序列化响应
    static std::string serializeResponse(const Response& response);

    // 序列化简单字符串
    static std::string serializeSimpleString(const std::string& str);

    // 序列化错误
    static std::string serializeError(const std::string& error);

    // 序列化整数
    static std::string serializeInteger(int64_t value);

    // 序列化批量字符串
    static std::string serializeBulkString(const std::string& str);

    // 序列化数组
    static std::string serializeArray(const std::vector<std::string>& array);

    // 序列化空值
    static std::string serializeNull();

    // 把参数编码为RESP数组命令，客户端和测试使用
    static std::string serializeCommand(const std::vector<std::string>& args);

private:
    friend class RESPFrameScanner;

    static RESPValue decodeValue(const std::string& data, size_t& pos, int depth);

    static RESPValue parseSimpleString(const std::string& data, size_t& pos);

    static RESPValue parseBulkString(const std::string& data, size_t& pos);

    static RESPValue parseArray(const std::string& data, size_t& pos, int depth);

    // 逐位读取十进制数字直到CRLF
    static int64_t readLength(const std::string& data, size_t& pos, int64_t limit);

    // 期望pos处是CRLF并跳过
    static void expectCRLF(const std::string& data, size_t& pos);

    // 把CR和LF替换为空格
    static std::string sanitizeLine(const std::string& str);
};

// 增量帧扫描器：只确定缓冲区中第一个完整帧的长度，不分配元素
// 在多次读取之间保留进度，每个字节只被扫描常数次
// 帧完整后再交给RESPProtocol::decode一次性解码
class RESPFrameScanner {
public:
    RESPFrameScanner() { reset(); }

    // 从data[start]开始继续扫描，返回完整帧的字节数，帧不完整时返回0
    // 两次调用之间start以及start之后已扫描的字节不能改变，格式错误时抛出ProtocolError
    size_t scan(const std::string& data, size_t start);

    // 丢弃当前进度，从下一个帧的开头重新扫描
    void reset();

private:
    size_t offset_;                 // 已扫描完的字节数（相对帧起点）
    size_t line_offset_;            // 未结束的简单字符串已检查到的位置（相对帧起点）
    std::vector<int64_t> pending_;  // 每层未结束数组剩余的元素个数

    // 扫描offset_处的一个简单字符串，不完整时返回false
    bool skipSimpleString(const std::string& data, size_t start);
};

} // namespace rkv
