#include "rkv_command_handler.hpp"
#include "net/rkv_resp.hpp"
#include "rkv_logger.hpp"
#include "rkv_utils.hpp"
#include <cctype>

namespace rkv {

namespace {

std::string lowerName(const Command& command) {
    std::string name = command.name.empty() ? Utils::commandTypeToString(command.type) : command.name;
    for (auto& c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return name;
}

} // namespace

Response CommandHandler::execute(const Command& command, StorageEngine& storage) {
    try {
        return dispatch(command, storage);
    } catch (const ArgumentError& e) {
        RKV_LOG_DEBUG("命令参数错误: ", e.what());
        return Response(ResponseStatus::ERROR, e.what());
    } catch (const UnknownCommandError& e) {
        RKV_LOG_DEBUG("未知命令: ", e.what());
        return Response(ResponseStatus::ERROR, e.what());
    }
}

std::string CommandHandler::executeToReply(const Command& command, StorageEngine& storage) {
    return RESPProtocol::serializeResponse(execute(command, storage));
}

Response CommandHandler::dispatch(const Command& command, StorageEngine& storage) {
    switch (command.type) {
        case CommandType::PING:
            return handlePingCommand(command);
        case CommandType::ECHO:
            return handleEchoCommand(command);
        case CommandType::SET:
            return handleSetCommand(command, storage);
        case CommandType::GET:
            return handleGetCommand(command, storage);
        default:
            throw UnknownCommandError("ERR unknown command '" + command.name + "'");
    }
}

Response CommandHandler::handlePingCommand(const Command& command) {
    validateParamCount(command, 0, 0);
    return Response(ResponseStatus::OK, "PONG");
}

Response CommandHandler::handleEchoCommand(const Command& command) {
    validateParamCount(command, 1, command.args.size());

    // 多个参数直接拼接，不加分隔符
    std::string result;
    for (const auto& arg : command.args) {
        result += arg;
    }
    return Response(ResponseStatus::OK, result);
}

Response CommandHandler::handleSetCommand(const Command& command, StorageEngine& storage) {
    validateParamCount(command, 2, 4);

    const std::string& key = command.args[0];
    const std::string& value = command.args[1];

    // 第三个参数为PX且第四个参数为整数时设置毫秒过期时间，否则使用默认有效期
    int64_t ms = 0;
    if (command.args.size() == 4 && Utils::equalsIgnoreCase(command.args[2], "PX") &&
        Utils::parseInt64(command.args[3], ms)) {
        storage.set(key, value, ms);
        RKV_LOG_DEBUG("设置键 ", key, " 带有过期时间 ", ms, " 毫秒");
    } else {
        storage.set(key, value);
        RKV_LOG_DEBUG("设置键 ", key);
    }

    return Response(ResponseStatus::OK, "OK");
}

Response CommandHandler::handleGetCommand(const Command& command, StorageEngine& storage) {
    validateParamCount(command, 1, 1);

    const std::string& key = command.args[0];
    auto value = storage.get(key);
    if (!value) {
        RKV_LOG_DEBUG("键 ", key, " 不存在或已过期");
        return Response(ResponseStatus::NOT_FOUND);
    }
    return Response(ResponseStatus::BULK, "", *value);
}

void CommandHandler::validateParamCount(const Command& command, size_t min_count, size_t max_count) {
    if (command.args.size() < min_count || command.args.size() > max_count) {
        throw ArgumentError("ERR wrong number of arguments for '" + lowerName(command) + "' command");
    }
}

} // namespace rkv
