#include "rkv_config.hpp"
#include "rkv_logger.hpp"
#include "rkv_utils.hpp"
#include <fstream>
#include <sstream>

namespace rkv {

bool ServerConfig::loadFromFile(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        RKV_LOG_ERROR("无法打开配置文件: ", config_file);
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        // 跳过注释和空行
        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key >> value)) {
            RKV_LOG_ERROR("配置文件第 ", line_no, " 行缺少值: ", line);
            return false;
        }

        bool known = false;
        if (!apply(key, value, known)) {
            if (!known) {
                RKV_LOG_WARNING("忽略未知配置项: ", key);
                continue;
            }
            RKV_LOG_ERROR("配置文件第 ", line_no, " 行的值非法: ", key, " ", value);
            return false;
        }
    }

    return true;
}

bool ServerConfig::apply(const std::string& key, const std::string& value, bool& known) {
    known = true;
    int64_t number = 0;

    if (key == "bind") {
        bind_address = value;
    } else if (key == "port") {
        if (!Utils::parseInt64(value, number) || number < 0 || number > 65535) {
            return false;
        }
        port = static_cast<int>(number);
    } else if (key == "read_buffer_size") {
        if (!Utils::parseInt64(value, number) || number <= 0) {
            return false;
        }
        read_buffer_size = static_cast<size_t>(number);
    } else if (key == "log_level") {
        LogLevel level;
        if (!Logger::parseLevel(value, level)) {
            return false;
        }
        log_level = value;
    } else if (key == "log_file") {
        log_file = value;
    } else {
        known = false;
        return false;
    }
    return true;
}

} // namespace rkv
