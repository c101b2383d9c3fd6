#include "net/rkv_connection.hpp"
#include "net/rkv_resp.hpp"
#include "rkv_command_handler.hpp"
#include "rkv_errors.hpp"
#include "rkv_logger.hpp"
#include "rkv_utils.hpp"
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace rkv {

ClientConnection::ClientConnection(int fd, const std::string& peer, std::shared_ptr<StorageEngine> storage,
                                   size_t read_buffer_size)
    : fd_(fd),
      peer_(peer),
      storage_(std::move(storage)),
      read_offset_(0),
      chunk_(read_buffer_size > 0 ? read_buffer_size : 1),
      finished_(false),
      commands_processed_(0) {}

ClientConnection::~ClientConnection() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

void ClientConnection::run() {
    RKV_LOG_INFO("客户端连接: ", peer_);

    try {
        serve();
    } catch (const std::exception& e) {
        // 单个连接的异常只结束该连接
        RKV_LOG_ERROR("连接 ", peer_, " 异常终止: ", e.what());
    }

    // 对端立即读到EOF，fd由析构函数关闭
    shutdown();
    finished_ = true;
    RKV_LOG_INFO("客户端断开连接: ", peer_, " ,处理命令数: ", commands_processed_.load());
}

void ClientConnection::serve() {
    while (true) {
        Command command;
        try {
            if (scanner_.scan(read_buffer_, read_offset_) == 0) {
                // 帧不完整，继续读取，扫描进度保留到下一次
                if (!readMore()) {
                    break;
                }
                continue;
            }
            // 帧已完整，只解码一次
            auto decoded = RESPProtocol::decode(read_buffer_, read_offset_);
            read_offset_ += decoded.second;
            command = RESPProtocol::toCommand(decoded.first);
        } catch (const ProtocolError& e) {
            replyProtocolError(e.what());
            break;
        } catch (const CommandError& e) {
            replyProtocolError(e.what());
            break;
        }

        RKV_LOG_DEBUG("客户端 ", peer_, " 命令: ", command.name, " 参数个数: ", command.args.size());
        commands_processed_++;

        std::string reply = CommandHandler::executeToReply(command, *storage_);
        if (!writeAll(reply)) {
            break;
        }
    }
}

void ClientConnection::shutdown() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

bool ClientConnection::readMore() {
    // 丢弃已处理的帧，未完成的帧移到缓冲区开头
    if (read_offset_ > 0) {
        read_buffer_.erase(0, read_offset_);
        read_offset_ = 0;
    }

    while (true) {
        ssize_t bytes_read = recv(fd_, chunk_.data(), chunk_.size(), 0);
        if (bytes_read > 0) {
            read_buffer_.append(chunk_.data(), static_cast<size_t>(bytes_read));
            return true;
        }
        if (bytes_read == 0) {
            if (!read_buffer_.empty()) {
                RKV_LOG_DEBUG("客户端 ", peer_, " 关闭时仍有未完成的帧: ", Utils::escapeForLog(read_buffer_));
            }
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        RKV_LOG_ERROR("读取客户端数据失败: ", peer_, " ", strerror(errno));
        return false;
    }
}

bool ClientConnection::writeAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            RKV_LOG_ERROR("发送响应失败: ", peer_, " ", strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void ClientConnection::replyProtocolError(const std::string& detail) {
    RKV_LOG_WARNING("客户端 ", peer_, " 协议错误: ", detail);
    if (!writeAll(RESPProtocol::serializeError("ERR Protocol error: " + detail))) {
        RKV_LOG_DEBUG("协议错误回复未能送达: ", peer_);
    }
}

} // namespace rkv
