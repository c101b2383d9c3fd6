#include "rkv_server.hpp"
#include "rkv_command_handler.hpp"
#include "rkv_logger.hpp"

namespace rkv {

RKVServer::RKVServer(const ServerConfig& config)
    : config_(config), storage_engine_(std::make_shared<StorageEngine>()) {}

RKVServer::~RKVServer() {
    stop();
}

bool RKVServer::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (network_server_ && network_server_->isRunning()) {
        return true;
    }

    RKV_LOG_INFO("正在启动RKV服务器，地址: ", config_.bind_address, ":", config_.port,
                 " ,读缓冲区大小: ", config_.read_buffer_size);

    auto network_server = std::make_unique<NetworkServer>(storage_engine_, config_);
    if (!network_server->start()) {
        RKV_LOG_ERROR("网络服务启动失败");
        return false;
    }
    network_server_ = std::move(network_server);
    return true;
}

void RKVServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!network_server_) {
        return;
    }
    network_server_->stop();
    network_server_.reset();
    RKV_LOG_INFO("RKV服务器已停止");
}

bool RKVServer::isRunning() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return network_server_ && network_server_->isRunning();
}

uint16_t RKVServer::getPort() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return network_server_ ? network_server_->getPort() : 0;
}

Response RKVServer::executeCommand(const Command& command) {
    return CommandHandler::execute(command, *storage_engine_);
}

} // namespace rkv
