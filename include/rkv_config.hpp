#pragma once

#include <cstddef>
#include <string>

namespace rkv {

// 服务器配置
struct ServerConfig {
    std::string bind_address = "127.0.0.1";
    int port = 6379;
    size_t read_buffer_size = 4096;   // 每次read的缓冲区大小
    std::string log_level = "info";
    std::string log_file;             // 为空则不输出到文件

    // 解析 "key value" 格式的配置文件，#开头为注释
    // 文件无法打开或数值非法时返回false，未知配置项只记录警告
    bool loadFromFile(const std::string& config_file);

    // 设置单个配置项，失败时返回false并保持原值，known标记配置项是否存在
    bool apply(const std::string& key, const std::string& value, bool& known);
};

} // namespace rkv
