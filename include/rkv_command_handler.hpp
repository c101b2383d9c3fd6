#ifndef RKV_COMMAND_HANDLER_HPP
#define RKV_COMMAND_HANDLER_HPP

#include "rkv_core.hpp"
#include "rkv_errors.hpp"
#include "storage/rkv_storage.hpp"
#include <string>

namespace rkv {

// 命令处理器，本身不持有任何状态，所有可变状态都在存储引擎中
class CommandHandler {
public:
    // 执行命令，参数错误和未知命令转换为ERROR响应
    static Response execute(const Command& command, StorageEngine& storage);

    // 执行命令并序列化为RESP回复
    static std::string executeToReply(const Command& command, StorageEngine& storage);

    // 执行命令，参数错误抛出ArgumentError，未知命令抛出UnknownCommandError
    static Response dispatch(const Command& command, StorageEngine& storage);

    // 基本命令处理
    static Response handlePingCommand(const Command& command);
    static Response handleEchoCommand(const Command& command);
    static Response handleSetCommand(const Command& command, StorageEngine& storage);
    static Response handleGetCommand(const Command& command, StorageEngine& storage);

private:
    // 通用参数验证
    static void validateParamCount(const Command& command, size_t min_count, size_t max_count);
};

} // namespace rkv

#endif // RKV_COMMAND_HANDLER_HPP
