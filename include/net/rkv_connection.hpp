#pragma once

#include "../rkv_core.hpp"
#include "../storage/rkv_storage.hpp"
#include "rkv_resp.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace rkv {

// 单个客户端连接：读取-解析-执行-写回循环
// 拥有socket fd，析构时关闭
class ClientConnection {
public:
    ClientConnection(int fd, const std::string& peer, std::shared_ptr<StorageEngine> storage,
                     size_t read_buffer_size = 4096);
    ~ClientConnection();

    ClientConnection(const ClientConnection&) = delete;
    ClientConnection& operator=(const ClientConnection&) = delete;

    // 阻塞运行直到对端关闭、读写失败或遇到协议错误
    void run();

    // 从其他线程唤醒阻塞中的读写，fd本身仍由析构函数关闭
    void shutdown();

    bool isFinished() const { return finished_.load(); }
    uint64_t getCommandsProcessed() const { return commands_processed_.load(); }

private:
    int fd_;
    std::string peer_;
    std::shared_ptr<StorageEngine> storage_;
    std::string read_buffer_;
    size_t read_offset_;            // read_buffer_中已处理的字节数
    RESPFrameScanner scanner_;
    std::vector<char> chunk_;
    std::atomic<bool> finished_;
    std::atomic<uint64_t> commands_processed_;

    // 读取-解析-执行-写回主循环
    void serve();

    // 读取更多数据追加到read_buffer_，对端关闭或出错时返回false
    bool readMore();

    // 完整写出数据，处理部分写
    bool writeAll(const std::string& data);

    // 发送协议错误并结束连接
    void replyProtocolError(const std::string& detail);
};

} // namespace rkv
