#pragma once

#include "../rkv_core.hpp"
#include "../rkv_config.hpp"
#include "../storage/rkv_storage.hpp"
#include "rkv_connection.hpp"
#include <sys/epoll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace rkv {

// 网络服务器：主线程负责accept，每个连接一个独立线程
// 所有连接共享同一个存储引擎
class NetworkServer {
private:
    // 连接及其运行线程
    struct ConnectionSlot {
        std::shared_ptr<ClientConnection> connection;
        std::thread thread;
    };

    int server_fd_;
    int epoll_fd_;
    sockaddr_in server_addr_;
    std::atomic<bool> running_;
    // 上一次accept因fd或内存耗尽失败，只在accept线程中访问
    bool accept_exhausted_;
    ServerConfig config_;
    std::shared_ptr<StorageEngine> storage_;

    // 主事件循环线程
    std::thread main_event_loop_thread_;

    std::list<ConnectionSlot> connections_;
    mutable std::mutex connections_mutex_;

public:
    // fd或内存耗尽时，accept线程在下一次尝试前等待的时间
    static constexpr std::chrono::milliseconds ACCEPT_BACKOFF{100};

    NetworkServer(std::shared_ptr<StorageEngine> storage, const ServerConfig& config);
    ~NetworkServer();

    NetworkServer(const NetworkServer&) = delete;
    NetworkServer& operator=(const NetworkServer&) = delete;

    // 启动和停止服务器
    bool start();
    void stop();

    bool isRunning() const { return running_.load(); }

    // 实际监听端口（配置端口为0时由系统分配）
    uint16_t getPort() const { return ntohs(server_addr_.sin_port); }

    // 当前未回收的连接数
    size_t getConnectionCount() const;

private:
    // 初始化监听socket
    bool initializeServer();

    // 主事件循环（仅处理新连接）
    void mainEventLoop();

    // 接受所有待处理的新连接并为每个连接启动线程
    void handleNewConnection();

    // 回收已结束的连接线程
    void reapFinishedConnections();

    // 连接线程入口
    static void connectionThread(std::shared_ptr<ClientConnection> connection);

    bool setNonBlocking(int fd);
    bool addEpollEvent(int fd, uint32_t events);
    void closeSockets();
};

} // namespace rkv
