#include "rkv_server.hpp"
#include "rkv_config.hpp"
#include "rkv_logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace rkv {

// 信号处理只设置退出标志，由主线程停止服务器
std::atomic<bool> g_should_exit{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_should_exit = true;
    }
}

void printHelp() {
    std::cout << "RKV - 兼容RESP协议的内存键值服务器 v0.1\n" << std::endl;
    std::cout << "用法: rkv_server [选项]\n" << std::endl;
    std::cout << "选项:" << std::endl;
    std::cout << "  -c, --config <file>     使用指定的配置文件" << std::endl;
    std::cout << "  -b, --bind <addr>       设置监听地址（默认：127.0.0.1）" << std::endl;
    std::cout << "  -p, --port <port>       设置服务器端口（默认：6379）" << std::endl;
    std::cout << "  -l, --log-level <level> 设置日志等级（debug, info, warning, error, critical, 默认：info）" << std::endl;
    std::cout << "  -f, --log-file <file>   设置日志文件路径" << std::endl;
    std::cout << "  -v, --version           显示版本信息" << std::endl;
    std::cout << "  -h, --help              显示帮助信息" << std::endl;
    std::cout << "\n示例:" << std::endl;
    std::cout << "  rkv_server                     # 使用默认配置启动" << std::endl;
    std::cout << "  rkv_server -p 6380             # 在端口6380启动" << std::endl;
    std::cout << "  rkv_server -c rkv.conf         # 使用配置文件启动" << std::endl;
    std::cout << "  rkv_server -l debug -f rkv.log # 启用调试日志并输出到文件" << std::endl;
}

void printVersion() {
    std::cout << "RKV v0.1.0" << std::endl;
}

// 命令行选项，覆盖配置文件中的值
struct CommandLineOptions {
    std::string config_file;
    bool show_help = false;
    bool show_version = false;
    // 按出现顺序记录的覆盖项
    std::vector<std::pair<std::string, std::string>> overrides;
};

// 解析失败返回false，错误信息已输出到stderr
bool parseArguments(int argc, char* argv[], CommandLineOptions& options) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto requireValue = [&](const char* what) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "错误: " << arg << " 需要指定" << what << std::endl;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            options.show_version = true;
        } else if (arg == "-c" || arg == "--config") {
            const char* value = requireValue("配置文件");
            if (!value) return false;
            options.config_file = value;
        } else if (arg == "-b" || arg == "--bind") {
            const char* value = requireValue("监听地址");
            if (!value) return false;
            options.overrides.emplace_back("bind", value);
        } else if (arg == "-p" || arg == "--port") {
            const char* value = requireValue("端口号");
            if (!value) return false;
            options.overrides.emplace_back("port", value);
        } else if (arg == "-l" || arg == "--log-level") {
            const char* value = requireValue("日志等级");
            if (!value) return false;
            options.overrides.emplace_back("log_level", value);
        } else if (arg == "-f" || arg == "--log-file") {
            const char* value = requireValue("日志文件路径");
            if (!value) return false;
            options.overrides.emplace_back("log_file", value);
        } else {
            std::cerr << "未知参数: " << arg << std::endl;
            std::cerr << "使用 -h 或 --help 查看帮助信息" << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace rkv

int main(int argc, char* argv[]) {
    using namespace rkv;

    CommandLineOptions options;
    if (!parseArguments(argc, argv, options)) {
        return 1;
    }
    if (options.show_help) {
        printHelp();
        return 0;
    }
    if (options.show_version) {
        printVersion();
        return 0;
    }

    ServerConfig config;
    if (!options.config_file.empty() && !config.loadFromFile(options.config_file)) {
        std::cerr << "加载配置文件失败: " << options.config_file << std::endl;
        return 1;
    }
    for (const auto& item : options.overrides) {
        bool known = false;
        if (!config.apply(item.first, item.second, known)) {
            std::cerr << "无效的参数值: " << item.first << " " << item.second << std::endl;
            return 1;
        }
    }

    // 配置日志系统
    auto& logger = Logger::getInstance();
    LogLevel level = LogLevel::INFO;
    if (Logger::parseLevel(config.log_level, level)) {
        logger.setLogLevel(level);
    }
    if (!config.log_file.empty()) {
        if (!logger.setLogFile(config.log_file)) {
            std::cerr << "无法打开日志文件: " << config.log_file << std::endl;
            return 1;
        }
        RKV_LOG_INFO("日志文件已设置为: ", config.log_file);
    }
    if (!options.config_file.empty()) {
        RKV_LOG_INFO("成功加载配置文件: ", options.config_file);
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGPIPE, SIG_IGN);

    RKVServer server(config);
    if (!server.start()) {
        RKV_LOG_ERROR("启动服务器失败");
        return 1;
    }

    RKV_LOG_INFO("服务器已成功启动，端口: ", server.getPort());

    // 等待退出信号
    while (server.isRunning() && !g_should_exit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    RKV_LOG_INFO("收到中断信号，正在关闭服务器...");
    server.stop();

    logger.closeLogFile();
    return 0;
}
