#include "mcp/McpServer.h"
#include "mcp/JsonRpc.h"
#include "tools/ToolRegistry.h"
#include "telemetry/Analytics.h"
#include "core/Version.h"
#include "utils/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace {
const char* kSupportedProtocolVersions[] = {"2024-11-05", "2025-03-26", "2025-06-18"};
}

McpServer::McpServer(ToolRegistry& registry, Analytics& analytics, Logger& logger)
    : registry(registry), analytics(analytics), logger(logger) {}

std::optional<nlohmann::json> McpServer::handleMessage(const nlohmann::json& message) {
    if (auto problem = JsonRpc::validateRequest(message)) {
        throw JsonRpc::RpcError(JsonRpc::INVALID_REQUEST, "Invalid Request: " + *problem);
    }

    const std::string method = message["method"].get<std::string>();
    const nlohmann::json params = message.contains("params") ? message["params"] : nlohmann::json::object();

    if (JsonRpc::isNotification(message)) {
        if (method == "notifications/initialized") {
            initialized = true;
            logger.info("client initialized");
        } else {
            logger.debug("ignoring notification " + method);
        }
        return std::nullopt;
    }

    nlohmann::json result;
    if (method == "initialize") {
        result = handleInitialize(params);
    } else if (method == "ping") {
        result = nlohmann::json::object();
    } else if (method == "tools/list") {
        result = handleToolsList();
    } else if (method == "tools/call") {
        result = handleToolsCall(params);
    } else {
        throw JsonRpc::RpcError(JsonRpc::METHOD_NOT_FOUND, "Method not found: " + method);
    }
    return JsonRpc::makeResult(message["id"], result);
}

nlohmann::json McpServer::handleInitialize(const nlohmann::json& params) {
    std::string version = kProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        std::string requested = params["protocolVersion"].get<std::string>();
        auto end = std::end(kSupportedProtocolVersions);
        if (std::find(std::begin(kSupportedProtocolVersions), end, requested) != end) {
            version = requested;
        }
    }

    std::string client = "unknown";
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        client = params["clientInfo"].value("name", client);
    }
    logger.info("initialize from " + client + " (protocol " + version + ")");

    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", TFMCP_SERVER_NAME}, {"version", TFMCP_VERSION}}}
    };
}

nlohmann::json McpServer::handleToolsList() {
    return {{"tools", registry.listTools()}};
}

nlohmann::json McpServer::handleToolsCall(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw JsonRpc::RpcError(JsonRpc::INVALID_PARAMS, "tools/call requires a string \"name\"");
    }
    const std::string name = params["name"].get<std::string>();
    nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
    if (args.is_null()) {
        args = nlohmann::json::object();
    }
    if (!args.is_object()) {
        throw JsonRpc::RpcError(JsonRpc::INVALID_PARAMS, "tools/call \"arguments\" must be an object");
    }

    nlohmann::json result;
    try {
        result = registry.executeTool(name, args);
    } catch (const std::out_of_range& e) {
        analytics.track("tool_called", {{"tool", name}, {"success", false}});
        throw JsonRpc::RpcError(JsonRpc::INVALID_PARAMS, e.what());
    }

    bool success = !(result.is_object() && result.value("isError", false));
    analytics.track("tool_called", {{"tool", name}, {"success", success}});
    logger.debug("tools/call " + name + (success ? " succeeded" : " failed"));
    return result;
}
