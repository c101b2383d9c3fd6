#include "rkv_core.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_map>

namespace rkv {

CommandType Utils::stringToCommandType(const std::string& cmd) {
    static const std::unordered_map<std::string, CommandType> command_map = {
        {"PING", CommandType::PING},
        {"ECHO", CommandType::ECHO},
        {"SET", CommandType::SET},
        {"GET", CommandType::GET},
    };

    auto it = command_map.find(toUpper(cmd));
    return (it != command_map.end()) ? it->second : CommandType::UNKNOWN;
}

std::string Utils::commandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::PING:
            return "PING";
        case CommandType::ECHO:
            return "ECHO";
        case CommandType::SET:
            return "SET";
        case CommandType::GET:
            return "GET";
        default:
            return "UNKNOWN";
    }
}

TimestampMs Utils::getCurrentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string Utils::toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool Utils::equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
        return std::toupper(x) == std::toupper(y);
    });
}

bool Utils::parseInt64(const std::string& str, int64_t& out) {
    if (str.empty()) {
        return false;
    }

    size_t i = 0;
    bool negative = false;
    if (str[0] == '-') {
        negative = true;
        i = 1;
        if (str.size() == 1) {
            return false;
        }
    }

    // 以负数累加，覆盖 INT64_MIN
    int64_t value = 0;
    const int64_t min = std::numeric_limits<int64_t>::min();
    for (; i < str.size(); ++i) {
        char c = str[i];
        if (c < '0' || c > '9') {
            return false;
        }
        int digit = c - '0';
        if (value < (min + digit) / 10) {
            return false;
        }
        value = value * 10 - digit;
    }

    if (!negative) {
        if (value == min) {
            return false;
        }
        value = -value;
    }
    out = value;
    return true;
}

std::string Utils::escapeForLog(const std::string& str, size_t max_len) {
    std::string result;
    size_t limit = std::min(str.size(), max_len);
    for (size_t i = 0; i < limit; ++i) {
        char c = str[i];
        if (c == '\r') {
            result += "\\r";
        } else if (c == '\n') {
            result += "\\n";
        } else if (std::isprint(static_cast<unsigned char>(c))) {
            result += c;
        } else {
            result += '.';
        }
    }
    if (str.size() > max_len) {
        result += "...";
    }
    return result;
}

} // namespace rkv
