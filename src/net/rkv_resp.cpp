#include "net/rkv_resp.hpp"
#include "rkv_utils.hpp"
#include <algorithm>

namespace rkv {

RESPValue RESPValue::simpleString(const std::string& s) {
    RESPValue value;
    value.type = RESPType::SIMPLE_STRING;
    value.str = s;
    return value;
}

RESPValue RESPValue::bulkString(const std::string& s) {
    RESPValue value;
    value.type = RESPType::BULK_STRING;
    value.str = s;
    return value;
}

RESPValue RESPValue::array(std::vector<RESPValue> items) {
    RESPValue value;
    value.type = RESPType::ARRAY;
    value.elements = std::move(items);
    return value;
}

bool RESPValue::operator==(const RESPValue& other) const {
    if (type != other.type) {
        return false;
    }
    if (type == RESPType::ARRAY) {
        return elements == other.elements;
    }
    return str == other.str;
}

// RESPProtocol 实现

std::pair<RESPValue, size_t> RESPProtocol::decode(const std::string& data, size_t pos) {
    size_t cursor = pos;
    RESPValue value = decodeValue(data, cursor, 0);
    return {std::move(value), cursor - pos};
}

RESPValue RESPProtocol::decodeValue(const std::string& data, size_t& pos, int depth) {
    if (pos >= data.length()) {
        throw IncompleteInput();
    }

    switch (data[pos]) {
        case '+':
            return parseSimpleString(data, pos);
        case '$':
            return parseBulkString(data, pos);
        case '*':
            return parseArray(data, pos, depth);
        default:
            throw ProtocolError("unsupported type byte '" + Utils::escapeForLog(std::string(1, data[pos])) + "'");
    }
}

RESPValue RESPProtocol::parseSimpleString(const std::string& data, size_t& pos) {
    size_t start = pos + 1; // 跳过 '+'
    size_t cur = start;
    while (cur < data.length()) {
        char c = data[cur];
        if (c == '\r') {
            if (cur + 1 >= data.length()) {
                throw IncompleteInput();
            }
            if (data[cur + 1] != '\n') {
                throw ProtocolError("expected LF after CR in simple string");
            }
            RESPValue value = RESPValue::simpleString(data.substr(start, cur - start));
            pos = cur + 2;
            return value;
        }
        if (c == '\n') {
            throw ProtocolError("unexpected LF in simple string");
        }
        ++cur;
    }
    throw IncompleteInput();
}

RESPValue RESPProtocol::parseBulkString(const std::string& data, size_t& pos) {
    size_t cur = pos + 1; // 跳过 '$'
    int64_t length = readLength(data, cur, MAX_BULK_LENGTH);

    size_t payload_len = static_cast<size_t>(length);
    if (data.length() - cur < payload_len + 2) {
        // 负载和结尾CRLF还没有全部到达，先检查已到达部分的CRLF
        if (data.length() - cur > payload_len && data[cur + payload_len] != '\r') {
            throw ProtocolError("bulk string payload longer than declared length");
        }
        throw IncompleteInput();
    }

    RESPValue value = RESPValue::bulkString(data.substr(cur, payload_len));
    cur += payload_len;
    if (data[cur] != '\r' || data[cur + 1] != '\n') {
        throw ProtocolError("bulk string payload longer than declared length");
    }
    pos = cur + 2;
    return value;
}

RESPValue RESPProtocol::parseArray(const std::string& data, size_t& pos, int depth) {
    if (depth >= MAX_NESTING_DEPTH) {
        throw ProtocolError("array nesting too deep");
    }

    size_t cur = pos + 1; // 跳过 '*'
    int64_t count = readLength(data, cur, MAX_ARRAY_LENGTH);

    std::vector<RESPValue> items;
    items.reserve(static_cast<size_t>(std::min<int64_t>(count, 1024)));
    for (int64_t i = 0; i < count; ++i) {
        items.push_back(decodeValue(data, cur, depth + 1));
    }

    pos = cur;
    return RESPValue::array(std::move(items));
}

int64_t RESPProtocol::readLength(const std::string& data, size_t& pos, int64_t limit) {
    size_t cur = pos;
    int64_t value = 0;
    size_t digits = 0;

    while (cur < data.length() && data[cur] != '\r') {
        char c = data[cur];
        if (c < '0' || c > '9') {
            throw ProtocolError("invalid length character '" + Utils::escapeForLog(std::string(1, c)) + "'");
        }
        value = value * 10 + (c - '0');
        if (value > limit) {
            throw ProtocolError("length exceeds limit of " + std::to_string(limit));
        }
        ++digits;
        ++cur;
    }

    if (cur >= data.length()) {
        throw IncompleteInput();
    }
    if (digits == 0) {
        throw ProtocolError("empty length");
    }

    expectCRLF(data, cur);
    pos = cur;
    return value;
}

void RESPProtocol::expectCRLF(const std::string& data, size_t& pos) {
    if (pos >= data.length() || pos + 1 >= data.length()) {
        throw IncompleteInput();
    }
    if (data[pos] != '\r' || data[pos + 1] != '\n') {
        throw ProtocolError("expected CRLF");
    }
    pos += 2;
}

Command RESPProtocol::toCommand(const RESPValue& value) {
    if (value.type != RESPType::ARRAY) {
        throw CommandError("expected array of strings");
    }
    if (value.elements.empty()) {
        throw CommandError("empty command");
    }

    std::vector<std::string> args;
    args.reserve(value.elements.size() - 1);
    for (size_t i = 0; i < value.elements.size(); ++i) {
        if (!value.elements[i].isString()) {
            throw CommandError("command element " + std::to_string(i) + " is not a string");
        }
        if (i > 0) {
            args.push_back(value.elements[i].str);
        }
    }

    const std::string& name = value.elements[0].str;
    return Command(Utils::stringToCommandType(name), name, args);
}

std::string RESPProtocol::serializeResponse(const Response& response) {
    switch (response.status) {
        case ResponseStatus::OK:
            return serializeSimpleString(response.message.empty() ? "OK" : response.message);
        case ResponseStatus::BULK:
            return serializeBulkString(response.data);
        case ResponseStatus::NOT_FOUND:
            return serializeNull();
        case ResponseStatus::ERROR:
            return serializeError(response.message.empty() ? "ERR" : response.message);
        default:
            return serializeError("ERR unknown response");
    }
}

std::string RESPProtocol::serializeSimpleString(const std::string& str) {
    return "+" + sanitizeLine(str) + "\r\n";
}

std::string RESPProtocol::serializeError(const std::string& error) {
    return "-" + sanitizeLine(error) + "\r\n";
}

std::string RESPProtocol::sanitizeLine(const std::string& str) {
    // 单行回复中不能出现CR或LF，否则会破坏回复流的分帧
    std::string result = str;
    std::replace(result.begin(), result.end(), '\r', ' ');
    std::replace(result.begin(), result.end(), '\n', ' ');
    return result;
}

std::string RESPProtocol::serializeInteger(int64_t value) {
    return ":" + std::to_string(value) + "\r\n";
}

std::string RESPProtocol::serializeBulkString(const std::string& str) {
    return "$" + std::to_string(str.length()) + "\r\n" + str + "\r\n";
}

std::string RESPProtocol::serializeArray(const std::vector<std::string>& array) {
    std::string result = "*" + std::to_string(array.size()) + "\r\n";
    for (const auto& item : array) {
        result += serializeBulkString(item);
    }
    return result;
}

std::string RESPProtocol::serializeNull() {
    return "$-1\r\n";
}

std::string RESPProtocol::serializeCommand(const std::vector<std::string>& args) {
    return serializeArray(args);
}

// RESPFrameScanner 实现

void RESPFrameScanner::reset() {
    offset_ = 0;
    line_offset_ = 0;
    pending_.clear();
}

size_t RESPFrameScanner::scan(const std::string& data, size_t start) {
    while (true) {
        size_t cur = start + offset_;
        if (cur >= data.length()) {
            return 0;
        }

        // 长度行不完整时从该元素开头重新扫描，长度行本身很短
        try {
            switch (data[cur]) {
                case '+':
                    if (!skipSimpleString(data, start)) {
                        return 0;
                    }
                    break;
                case '$': {
                    size_t header = cur + 1;
                    int64_t length = RESPProtocol::readLength(data, header, RESPProtocol::MAX_BULK_LENGTH);
                    size_t payload_len = static_cast<size_t>(length);
                    if (data.length() - header < payload_len + 2) {
                        if (data.length() - header > payload_len && data[header + payload_len] != '\r') {
                            throw ProtocolError("bulk string payload longer than declared length");
                        }
                        return 0;
                    }
                    if (data[header + payload_len] != '\r' || data[header + payload_len + 1] != '\n') {
                        throw ProtocolError("bulk string payload longer than declared length");
                    }
                    offset_ = header + payload_len + 2 - start;
                    break;
                }
                case '*': {
                    if (pending_.size() >= static_cast<size_t>(RESPProtocol::MAX_NESTING_DEPTH)) {
                        throw ProtocolError("array nesting too deep");
                    }
                    size_t header = cur + 1;
                    int64_t count = RESPProtocol::readLength(data, header, RESPProtocol::MAX_ARRAY_LENGTH);
                    offset_ = header - start;
                    if (count > 0) {
                        pending_.push_back(count);
                        continue;
                    }
                    break;
                }
                default:
                    throw ProtocolError("unsupported type byte '" +
                                        Utils::escapeForLog(std::string(1, data[cur])) + "'");
            }
        } catch (const IncompleteInput&) {
            return 0;
        }

        // 一个元素结束，逐层减少外层数组的剩余个数
        while (true) {
            if (pending_.empty()) {
                size_t frame_len = offset_;
                reset();
                return frame_len;
            }
            if (--pending_.back() > 0) {
                break;
            }
            pending_.pop_back();
        }
    }
}

bool RESPFrameScanner::skipSimpleString(const std::string& data, size_t start) {
    size_t cur = std::max(start + offset_ + 1, start + line_offset_);
    while (cur < data.length()) {
        char c = data[cur];
        if (c == '\r') {
            if (cur + 1 >= data.length()) {
                line_offset_ = cur - start;
                return false;
            }
            if (data[cur + 1] != '\n') {
                throw ProtocolError("expected LF after CR in simple string");
            }
            offset_ = cur + 2 - start;
            line_offset_ = 0;
            return true;
        }
        if (c == '\n') {
            throw ProtocolError("unexpected LF in simple string");
        }
        ++cur;
    }
    line_offset_ = cur - start;
    return false;
}

} // namespace rkv
