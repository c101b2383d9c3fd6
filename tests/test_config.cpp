#include <gtest/gtest.h>
#include "rkv_config.hpp"
#include "rkv_logger.hpp"
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <unistd.h>

using namespace rkv;

class ServerConfigTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::CRITICAL);
        path_ = "rkv_test_config_" + std::to_string(getpid()) + ".conf";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void writeFile(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }
};

TEST_F(ServerConfigTest, Defaults) {
    ServerConfig config;
    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_EQ(config.port, 6379);
    EXPECT_EQ(config.read_buffer_size, 4096u);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(ServerConfigTest, LoadFromFile) {
    writeFile(
        "# rkv配置\n"
        "\n"
        "bind 0.0.0.0\n"
        "port 7000\r\n"
        "   # 缩进的注释\n"
        "read_buffer_size 128\n"
        "log_level DEBUG\n"
        "log_file /tmp/rkv.log\n");

    ServerConfig config;
    ASSERT_TRUE(config.loadFromFile(path_));
    EXPECT_EQ(config.bind_address, "0.0.0.0");
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.read_buffer_size, 128u);
    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_EQ(config.log_file, "/tmp/rkv.log");
}

TEST_F(ServerConfigTest, UnknownKeysAreSkipped) {
    writeFile("maxmemory 100mb\nport 6380\n");
    ServerConfig config;
    ASSERT_TRUE(config.loadFromFile(path_));
    EXPECT_EQ(config.port, 6380);
}

TEST_F(ServerConfigTest, InvalidValueFails) {
    const std::vector<std::string> bad = {
        "port 70000\n",
        "port -1\n",
        "port abc\n",
        "read_buffer_size 0\n",
        "log_level verbose\n",
        "port\n",
    };
    for (const auto& content : bad) {
        writeFile(content);
        ServerConfig config;
        EXPECT_FALSE(config.loadFromFile(path_)) << content;
    }
}

TEST_F(ServerConfigTest, MissingFileFails) {
    ServerConfig config;
    EXPECT_FALSE(config.loadFromFile("/nonexistent/rkv.conf"));
}

TEST_F(ServerConfigTest, ApplyKeepsOldValueOnFailure) {
    ServerConfig config;
    bool known = false;

    EXPECT_TRUE(config.apply("port", "0", known));
    EXPECT_TRUE(known);
    EXPECT_EQ(config.port, 0);

    EXPECT_FALSE(config.apply("port", "65536", known));
    EXPECT_TRUE(known);
    EXPECT_EQ(config.port, 0);

    EXPECT_FALSE(config.apply("appendonly", "yes", known));
    EXPECT_FALSE(known);
}

TEST(LoggerTest, ParseLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parseLevel("WARN", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(Logger::parseLevel("Critical", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);

    EXPECT_FALSE(Logger::parseLevel("loud", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);
}

TEST(LoggerTest, LevelFiltering) {
    auto& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::ERROR);
    EXPECT_FALSE(logger.isEnabled(LogLevel::INFO));
    EXPECT_TRUE(logger.isEnabled(LogLevel::ERROR));
    EXPECT_TRUE(logger.isEnabled(LogLevel::CRITICAL));
}

// 日志写入文件
TEST(LoggerTest, WritesToFile) {
    std::string path = "rkv_test_log_" + std::to_string(getpid()) + ".log";
    auto& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::INFO);
    logger.setConsoleOutput(false);
    ASSERT_TRUE(logger.setLogFile(path));

    RKV_LOG_INFO("写入测试日志 ", 42);
    RKV_LOG_INFOF("格式化 {} {}", "key", 7);
    RKV_LOG_DEBUG("不应出现");
    logger.closeLogFile();
    logger.setConsoleOutput(true);

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("写入测试日志 42"), std::string::npos);
    EXPECT_NE(content.find("格式化 key 7"), std::string::npos);
    EXPECT_EQ(content.find("不应出现"), std::string::npos);
    std::remove(path.c_str());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
