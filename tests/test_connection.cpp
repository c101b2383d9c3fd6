#include <gtest/gtest.h>
#include "net/rkv_connection.hpp"
#include "net/rkv_resp.hpp"
#include "rkv_logger.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <thread>

using namespace rkv;

// 用socketpair模拟客户端，服务端一侧交给ClientConnection
class ClientConnectionTest : public ::testing::Test {
protected:
    std::shared_ptr<StorageEngine> storage_ = std::make_shared<StorageEngine>();
    std::shared_ptr<ClientConnection> connection_;
    std::thread worker_;
    int client_fd_ = -1;

    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
    }

    void startConnection(size_t read_buffer_size = 4096) {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        client_fd_ = fds[1];

        timeval timeout{};
        timeout.tv_sec = 5;
        setsockopt(client_fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        connection_ = std::make_shared<ClientConnection>(fds[0], "socketpair", storage_, read_buffer_size);
        worker_ = std::thread([conn = connection_]() { conn->run(); });
    }

    void TearDown() override {
        if (client_fd_ >= 0) {
            close(client_fd_);
        }
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void sendRaw(const std::string& data) {
        ASSERT_EQ(send(client_fd_, data.data(), data.size(), MSG_NOSIGNAL), static_cast<ssize_t>(data.size()));
    }

    // 读取恰好n个字节，超时或对端关闭时返回已读到的部分
    std::string receive(size_t n) {
        std::string result;
        char buffer[4096];
        while (result.size() < n) {
            size_t want = std::min(sizeof(buffer), n - result.size());
            ssize_t got = recv(client_fd_, buffer, want, 0);
            if (got <= 0) {
                break;
            }
            result.append(buffer, static_cast<size_t>(got));
        }
        return result;
    }

    // 服务端关闭后读到EOF
    bool peerClosed() {
        char c;
        return recv(client_fd_, &c, 1, 0) == 0;
    }

    void waitFinished() {
        if (worker_.joinable()) {
            worker_.join();
        }
    }
};

TEST_F(ClientConnectionTest, Ping) {
    startConnection();
    sendRaw("*1\r\n$4\r\nPING\r\n");
    EXPECT_EQ(receive(7), "+PONG\r\n");
}

TEST_F(ClientConnectionTest, SetThenGet) {
    startConnection();
    sendRaw(RESPProtocol::serializeCommand({"SET", "name", "rkv"}));
    EXPECT_EQ(receive(5), "+OK\r\n");
    sendRaw(RESPProtocol::serializeCommand({"GET", "name"}));
    EXPECT_EQ(receive(9), "$3\r\nrkv\r\n");
    EXPECT_EQ(storage_->get("name"), std::optional<std::string>("rkv"));
}

// 一个帧被拆成多次写入
TEST_F(ClientConnectionTest, FrameSplitAcrossWrites) {
    startConnection();
    const std::string frame = "*2\r\n$4\r\nECHO\r\n$5\r\nhello\r\n";
    for (char c : frame) {
        sendRaw(std::string(1, c));
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(receive(8), "+hello\r\n");
}

// 帧大于单次读取缓冲区
TEST_F(ClientConnectionTest, FrameLargerThanReadBuffer) {
    startConnection(16);
    std::string value(10000, 'v');
    sendRaw(RESPProtocol::serializeCommand({"SET", "big", value}));
    EXPECT_EQ(receive(5), "+OK\r\n");

    sendRaw(RESPProtocol::serializeCommand({"GET", "big"}));
    std::string expected = RESPProtocol::serializeBulkString(value);
    EXPECT_EQ(receive(expected.size()), expected);
}

// 元素很多的大数组经过很小的读缓冲区，耗时与帧大小成线性关系
TEST_F(ClientConnectionTest, LargeArrayThroughSmallReadBuffer) {
    startConnection(16);
    const int NUM_ELEMENTS = 200000;
    std::string frame = "*" + std::to_string(NUM_ELEMENTS + 1) + "\r\n$4\r\nECHO\r\n";
    frame.reserve(frame.size() + NUM_ELEMENTS * 7);
    for (int i = 0; i < NUM_ELEMENTS; ++i) {
        frame += "$1\r\na\r\n";
    }

    auto begin = std::chrono::steady_clock::now();
    std::thread sender([this, &frame]() { sendRaw(frame); });
    std::string expected = "+" + std::string(NUM_ELEMENTS, 'a') + "\r\n";
    std::string reply = receive(expected.size());
    sender.join();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);

    EXPECT_EQ(reply, expected);
    EXPECT_LT(elapsed.count(), 5000);
    EXPECT_EQ(connection_->getCommandsProcessed(), 1u);
}

// 一次写入多个帧，按顺序逐个回复
TEST_F(ClientConnectionTest, PipelinedFrames) {
    startConnection();
    std::string batch = RESPProtocol::serializeCommand({"SET", "a", "1"}) +
                        RESPProtocol::serializeCommand({"GET", "a"}) +
                        RESPProtocol::serializeCommand({"PING"}) +
                        RESPProtocol::serializeCommand({"GET", "missing"});
    sendRaw(batch);
    std::string expected = "+OK\r\n$1\r\n1\r\n+PONG\r\n$-1\r\n";
    EXPECT_EQ(receive(expected.size()), expected);
    EXPECT_EQ(connection_->getCommandsProcessed(), 4u);
}

// 命令级错误不会关闭连接
TEST_F(ClientConnectionTest, CommandErrorsKeepConnectionOpen) {
    startConnection();
    sendRaw(RESPProtocol::serializeCommand({"FLUSHALL"}));
    std::string unknown = "-ERR unknown command 'FLUSHALL'\r\n";
    EXPECT_EQ(receive(unknown.size()), unknown);

    sendRaw(RESPProtocol::serializeCommand({"GET"}));
    std::string arity = "-ERR wrong number of arguments for 'get' command\r\n";
    EXPECT_EQ(receive(arity.size()), arity);

    sendRaw(RESPProtocol::serializeCommand({"PING"}));
    EXPECT_EQ(receive(7), "+PONG\r\n");
    EXPECT_FALSE(connection_->isFinished());
}

// 协议错误回复错误后关闭连接
TEST_F(ClientConnectionTest, ProtocolErrorClosesConnection) {
    startConnection();
    sendRaw("?garbage\r\n");
    std::string reply = receive(15);
    EXPECT_EQ(reply, "-ERR Protocol e");
    char c;
    while (recv(client_fd_, &c, 1, 0) > 0 && c != '\n') {
    }
    EXPECT_TRUE(peerClosed());
    waitFinished();
    EXPECT_TRUE(connection_->isFinished());
}

// 顶层不是数组的帧同样结束连接
TEST_F(ClientConnectionTest, NonArrayFrameClosesConnection) {
    startConnection();
    sendRaw("+PING\r\n");
    std::string reply = receive(4);
    EXPECT_EQ(reply, "-ERR");
    char c;
    while (recv(client_fd_, &c, 1, 0) > 0 && c != '\n') {
    }
    EXPECT_TRUE(peerClosed());
}

// 客户端关闭后连接线程结束
TEST_F(ClientConnectionTest, ClientCloseEndsConnection) {
    startConnection();
    sendRaw("*1\r\n$4\r\nPI");
    close(client_fd_);
    client_fd_ = -1;
    waitFinished();
    EXPECT_TRUE(connection_->isFinished());
    EXPECT_EQ(connection_->getCommandsProcessed(), 0u);
}

// 从其他线程调用shutdown唤醒阻塞的读取
TEST_F(ClientConnectionTest, ShutdownUnblocksRead) {
    startConnection();
    sendRaw(RESPProtocol::serializeCommand({"PING"}));
    EXPECT_EQ(receive(7), "+PONG\r\n");
    connection_->shutdown();
    waitFinished();
    EXPECT_TRUE(connection_->isFinished());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
