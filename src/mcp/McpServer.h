#pragma once
#include <string>
#include <atomic>
#include "mcp/IMessageHandler.h"

class ToolRegistry;
class Analytics;
class Logger;

/**
 * @brief MCP 请求分发
 *
 * 支持 initialize, notifications/initialized, ping, tools/list, tools/call。
 * 工具执行失败转为 isError 结果; 协议层错误抛出 JsonRpc::RpcError。
 * 每次 tools/call 记录一个 tool_called 遥测事件。
 */
class McpServer : public IMessageHandler {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";

    McpServer(ToolRegistry& registry, Analytics& analytics, Logger& logger);

    std::optional<nlohmann::json> handleMessage(const nlohmann::json& message) override;

    bool isInitialized() const { return initialized.load(); }

private:
    ToolRegistry& registry;
    Analytics& analytics;
    Logger& logger;
    std::atomic<bool> initialized{false};

    nlohmann::json handleInitialize(const nlohmann::json& params);
    nlohmann::json handleToolsList();
    nlohmann::json handleToolsCall(const nlohmann::json& params);
};
