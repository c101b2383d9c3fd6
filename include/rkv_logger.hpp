#ifndef RKV_LOGGER_HPP
#define RKV_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <chrono>
#include <ctime>
#include <mutex>
#include <atomic>
#include <iomanip>
#include <cctype>

namespace rkv {

// 日志等级枚举
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

// 日志系统类（单例，线程安全）
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLogLevel(LogLevel level) {
        log_level_.store(level);
    }

    LogLevel getLogLevel() const {
        return log_level_.load();
    }

    // 解析日志等级名称，不区分大小写，失败返回false
    static bool parseLevel(const std::string& name, LogLevel& level) {
        std::string lower;
        for (char c : name) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == "debug") {
            level = LogLevel::DEBUG;
        } else if (lower == "info") {
            level = LogLevel::INFO;
        } else if (lower == "warning" || lower == "warn") {
            level = LogLevel::WARNING;
        } else if (lower == "error") {
            level = LogLevel::ERROR;
        } else if (lower == "critical") {
            level = LogLevel::CRITICAL;
        } else {
            return false;
        }
        return true;
    }

    // 设置日志文件路径（追加写入），打开失败返回false
    bool setLogFile(const std::string& file_path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(file_path, std::ios::out | std::ios::app);
        return log_file_.is_open();
    }

    void closeLogFile() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    void setConsoleOutput(bool enable) {
        console_output_.store(enable);
    }

    bool isEnabled(LogLevel level) const {
        return level >= log_level_.load();
    }

    // 参数直接拼接
    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::stringstream ss;
        writePrefix(ss, level);
        (ss << ... << std::forward<Args>(args));
        write(level, ss.str());
    }

    // {}占位符格式化
    template<typename... Args>
    void logf(LogLevel level, const std::string& format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::stringstream ss;
        writePrefix(ss, level);
        formatArgs(ss, format, 0, std::forward<Args>(args)...);
        write(level, ss.str());
    }

    template<typename... Args>
    void debug(Args&&... args) { log(LogLevel::DEBUG, std::forward<Args>(args)...); }

    template<typename... Args>
    void info(Args&&... args) { log(LogLevel::INFO, std::forward<Args>(args)...); }

    template<typename... Args>
    void warning(Args&&... args) { log(LogLevel::WARNING, std::forward<Args>(args)...); }

    template<typename... Args>
    void error(Args&&... args) { log(LogLevel::ERROR, std::forward<Args>(args)...); }

    template<typename... Args>
    void critical(Args&&... args) { log(LogLevel::CRITICAL, std::forward<Args>(args)...); }

private:
    Logger() : log_level_(LogLevel::INFO), console_output_(true) {}

    ~Logger() {
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    // [2024-01-01 12:00:00.000] [INFO]
    static void writePrefix(std::stringstream& ss, LogLevel level) {
        auto now = std::chrono::system_clock::now();
        auto now_c = std::chrono::system_clock::to_time_t(now);
        std::tm now_tm{};
        localtime_r(&now_c, &now_tm);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        ss << "[" << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S") << "."
           << std::setw(3) << std::setfill('0') << now_ms.count() << "] "
           << "[" << levelToString(level) << "] ";
    }

    void write(LogLevel level, const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (console_output_.load()) {
            std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
            out << entry << std::endl;
        }
        if (log_file_.is_open()) {
            log_file_ << entry << std::endl;
        }
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARNING";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRITICAL";
            default:
                return "UNKNOWN";
        }
    }

    // 无剩余参数：输出format剩余部分
    static void formatArgs(std::stringstream& ss, const std::string& format, size_t pos) {
        ss << format.substr(pos);
    }

    template<typename T, typename... Args>
    static void formatArgs(std::stringstream& ss, const std::string& format, size_t pos, T&& arg, Args&&... args) {
        size_t placeholder = format.find("{}", pos);
        if (placeholder == std::string::npos) {
            ss << format.substr(pos);
            return;
        }
        ss << format.substr(pos, placeholder - pos) << std::forward<T>(arg);
        formatArgs(ss, format, placeholder + 2, std::forward<Args>(args)...);
    }

    std::atomic<LogLevel> log_level_;
    std::atomic<bool> console_output_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

} // namespace rkv

// 全局日志宏
#define RKV_LOG_DEBUG(...) ::rkv::Logger::getInstance().debug(__VA_ARGS__)
#define RKV_LOG_INFO(...) ::rkv::Logger::getInstance().info(__VA_ARGS__)
#define RKV_LOG_WARNING(...) ::rkv::Logger::getInstance().warning(__VA_ARGS__)
#define RKV_LOG_ERROR(...) ::rkv::Logger::getInstance().error(__VA_ARGS__)
#define RKV_LOG_CRITICAL(...) ::rkv::Logger::getInstance().critical(__VA_ARGS__)

// 格式化版本日志宏
#define RKV_LOG_DEBUGF(...) ::rkv::Logger::getInstance().logf(::rkv::LogLevel::DEBUG, __VA_ARGS__)
#define RKV_LOG_INFOF(...) ::rkv::Logger::getInstance().logf(::rkv::LogLevel::INFO, __VA_ARGS__)
#define RKV_LOG_WARNINGF(...) ::rkv::Logger::getInstance().logf(::rkv::LogLevel::WARNING, __VA_ARGS__)
#define RKV_LOG_ERRORF(...) ::rkv::Logger::getInstance().logf(::rkv::LogLevel::ERROR, __VA_ARGS__)
#define RKV_LOG_CRITICALF(...) ::rkv::Logger::getInstance().logf(::rkv::LogLevel::CRITICAL, __VA_ARGS__)

#endif // RKV_LOGGER_HPP
