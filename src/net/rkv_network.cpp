#include "net/rkv_network.hpp"
#include "rkv_logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iterator>
#include <system_error>
#include <utility>

namespace rkv {

NetworkServer::NetworkServer(std::shared_ptr<StorageEngine> storage, const ServerConfig& config)
    : server_fd_(-1), epoll_fd_(-1), running_(false), accept_exhausted_(false), config_(config),
      storage_(std::move(storage)) {
    memset(&server_addr_, 0, sizeof(server_addr_));
    server_addr_.sin_family = AF_INET;
    server_addr_.sin_port = htons(static_cast<uint16_t>(config_.port));
}

NetworkServer::~NetworkServer() {
    stop();
}

bool NetworkServer::start() {
    if (running_.load()) {
        return true;
    }
    if (!storage_) {
        RKV_LOG_ERROR("存储引擎未初始化，无法启动网络服务");
        return false;
    }
    if (!initializeServer()) {
        return false;
    }

    running_ = true;
    main_event_loop_thread_ = std::thread(&NetworkServer::mainEventLoop, this);

    RKV_LOG_INFO("RKV服务器启动成功，监听地址: ", config_.bind_address, ":", getPort());
    return true;
}

void NetworkServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // 等待主事件循环线程结束
    if (main_event_loop_thread_.joinable()) {
        main_event_loop_thread_.join();
    }

    closeSockets();

    // 唤醒并等待所有连接线程
    std::list<ConnectionSlot> slots;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        slots.swap(connections_);
    }
    for (auto& slot : slots) {
        slot.connection->shutdown();
    }
    for (auto& slot : slots) {
        if (slot.thread.joinable()) {
            slot.thread.join();
        }
    }

    RKV_LOG_INFO("RKV网络服务已停止，关闭连接数: ", slots.size());
}

size_t NetworkServer::getConnectionCount() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

bool NetworkServer::initializeServer() {
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &server_addr_.sin_addr) != 1) {
        RKV_LOG_ERROR("无效的监听地址: ", config_.bind_address);
        return false;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        RKV_LOG_ERROR("创建socket失败: ", strerror(errno));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        RKV_LOG_ERROR("设置socket选项失败: ", strerror(errno));
        closeSockets();
        return false;
    }

    if (!setNonBlocking(server_fd_)) {
        RKV_LOG_ERROR("设置非阻塞模式失败: ", strerror(errno));
        closeSockets();
        return false;
    }

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&server_addr_), sizeof(server_addr_)) < 0) {
        RKV_LOG_ERROR("绑定地址失败: ", config_.bind_address, ":", config_.port, " ", strerror(errno));
        closeSockets();
        return false;
    }

    if (listen(server_fd_, SOMAXCONN) < 0) {
        RKV_LOG_ERROR("开始监听失败: ", strerror(errno));
        closeSockets();
        return false;
    }

    // 端口为0时取回系统分配的端口
    socklen_t addr_len = sizeof(server_addr_);
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&server_addr_), &addr_len) < 0) {
        RKV_LOG_ERROR("获取监听地址失败: ", strerror(errno));
        closeSockets();
        return false;
    }

    epoll_fd_ = epoll_create1(0);
    if (epoll_fd_ < 0) {
        RKV_LOG_ERROR("创建epoll实例失败: ", strerror(errno));
        closeSockets();
        return false;
    }

    if (!addEpollEvent(server_fd_, EPOLLIN)) {
        RKV_LOG_ERROR("添加服务器socket到epoll失败: ", strerror(errno));
        closeSockets();
        return false;
    }

    return true;
}

void NetworkServer::mainEventLoop() {
    const int MAX_EVENTS = 16;
    struct epoll_event events[MAX_EVENTS];

    while (running_) {
        int num_events = epoll_wait(epoll_fd_, events, MAX_EVENTS, 100); // 100ms超时

        if (num_events < 0) {
            if (errno == EINTR) {
                continue;
            }
            RKV_LOG_ERROR("epoll_wait失败: ", strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        for (int i = 0; i < num_events; i++) {
            if (events[i].data.fd == server_fd_ && (events[i].events & EPOLLIN)) {
                handleNewConnection();
            }
        }

        reapFinishedConnections();
    }
}

void NetworkServer::handleNewConnection() {
    // 尽可能多地接受连接
    while (running_) {
        sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept4(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (errno == EMFILE || errno == ENFILE || errno == ENOBUFS || errno == ENOMEM) {
                // 监听socket仍然可读，不暂停的话epoll会立即再次返回
                if (!accept_exhausted_) {
                    RKV_LOG_ERROR("资源耗尽，暂停接受新连接: ", strerror(errno));
                    accept_exhausted_ = true;
                }
                std::this_thread::sleep_for(ACCEPT_BACKOFF);
            } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                RKV_LOG_ERROR("接受连接失败: ", strerror(errno));
            }
            break;
        }

        if (accept_exhausted_) {
            RKV_LOG_INFO("恢复接受新连接");
            accept_exhausted_ = false;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string peer = std::string(ip) + ":" + std::to_string(ntohs(client_addr.sin_port));

        auto connection = std::make_shared<ClientConnection>(client_fd, peer, storage_, config_.read_buffer_size);

        std::lock_guard<std::mutex> lock(connections_mutex_);
        ConnectionSlot slot;
        slot.connection = connection;
        try {
            slot.thread = std::thread(&NetworkServer::connectionThread, connection);
        } catch (const std::system_error& e) {
            RKV_LOG_ERROR("创建连接线程失败: ", peer, " ", e.what());
            continue;
        }
        connections_.push_back(std::move(slot));
    }
}

void NetworkServer::reapFinishedConnections() {
    std::list<ConnectionSlot> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->connection->isFinished()) {
                auto next = std::next(it);
                finished.splice(finished.end(), connections_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& slot : finished) {
        if (slot.thread.joinable()) {
            slot.thread.join();
        }
    }
}

void NetworkServer::connectionThread(std::shared_ptr<ClientConnection> connection) {
    connection->run();
}

bool NetworkServer::setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

bool NetworkServer::addEpollEvent(int fd, uint32_t events) {
    struct epoll_event event;
    event.events = events;
    event.data.fd = fd;
    return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &event) >= 0;
}

void NetworkServer::closeSockets() {
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

} // namespace rkv
