#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "transport/IDuplexStream.h"

class IMessageHandler;
class CancellationToken;
class Logger;

/**
 * @brief 消息循环 / 传输监听器
 *
 * 按行读取 JSON-RPC 消息, 分发给 IMessageHandler, 把响应写回一行。
 * 严格 FIFO: 当前请求的响应写出之后才读取下一条请求。
 *
 * 取消策略: 每次读取前检查 CancellationToken; 阻塞中的读取依赖
 * 流实现 (FdDuplexStream) 同时等待令牌的唤醒句柄, 或对端关闭流。
 */
class StdioServer {
public:
    static constexpr size_t kDefaultMaxMessageSize = 16 * 1024 * 1024;

    StdioServer(IMessageHandler& handler, Logger& logger,
                size_t maxMessageSize = kDefaultMaxMessageSize);

    /**
     * @brief 运行读取-分发-写回循环
     *
     * 流结束或令牌取消时正常返回。
     * 处理器错误不会终止循环, 只会变成 error 响应。
     * @throws TransportError 读失败, 写失败或单帧超过上限时
     */
    void listen(const CancellationToken& token, IDuplexStream& stream);

    size_t getHandledCount() const { return handledCount; }

private:
    IMessageHandler& handler;
    Logger& logger;
    size_t maxMessageSize;
    size_t handledCount = 0;

    void processLine(const std::string& line, IDuplexStream& stream);
    std::optional<nlohmann::json> dispatch(const nlohmann::json& message);
    void writeMessage(const nlohmann::json& message, IDuplexStream& stream);
};
