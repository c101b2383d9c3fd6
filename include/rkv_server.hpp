#pragma once

#include "rkv_core.hpp"
#include "rkv_config.hpp"
#include "storage/rkv_storage.hpp"
#include "net/rkv_network.hpp"
#include <memory>
#include <mutex>

namespace rkv {

// 服务器主类：持有配置、共享的存储引擎和网络服务
class RKVServer {
private:
    ServerConfig config_;
    std::shared_ptr<StorageEngine> storage_engine_;
    std::unique_ptr<NetworkServer> network_server_;
    mutable std::mutex lifecycle_mutex_;

public:
    explicit RKVServer(const ServerConfig& config = ServerConfig());
    ~RKVServer();

    RKVServer(const RKVServer&) = delete;
    RKVServer& operator=(const RKVServer&) = delete;

    // 启动和停止服务器
    bool start();
    void stop();

    bool isRunning() const;

    // 实际监听端口
    uint16_t getPort() const;

    const ServerConfig& getConfig() const { return config_; }

    std::shared_ptr<StorageEngine> getStorage() const { return storage_engine_; }

    // 执行一条命令（不经过网络）
    Response executeCommand(const Command& command);
};

} // namespace rkv
