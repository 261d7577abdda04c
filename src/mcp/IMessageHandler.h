#pragma once
#include <optional>
#include <nlohmann/json.hpp>

/**
 * @brief 消息处理接口
 *
 * 消息循环把每个解码后的消息交给它。实现可以抛出异常,
 * 循环会把异常转换为 JSON-RPC error 响应。
 */
class IMessageHandler {
public:
    virtual ~IMessageHandler() = default;

    /**
     * @param message 已解析的 JSON 消息 (未校验外形)
     * @return 要写回的响应; 通知返回 std::nullopt
     */
    virtual std::optional<nlohmann::json> handleMessage(const nlohmann::json& message) = 0;
};
