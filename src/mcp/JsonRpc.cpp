#include "mcp/JsonRpc.h"

namespace JsonRpc {

nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

bool isNotification(const nlohmann::json& message) {
    return message.is_object() && !message.contains("id");
}

nlohmann::json requestId(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("id")) {
        return nullptr;
    }
    const auto& id = message["id"];
    if (id.is_string() || id.is_number_integer() || id.is_number_unsigned()) {
        return id;
    }
    return nullptr;
}

std::optional<std::string> validateRequest(const nlohmann::json& message) {
    if (!message.is_object()) {
        return "request must be a JSON object";
    }
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return "jsonrpc must be \"2.0\"";
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return "method must be a string";
    }
    if (message.contains("id")) {
        const auto& id = message["id"];
        if (!id.is_string() && !id.is_number_integer() && !id.is_number_unsigned()) {
            return "id must be a string or an integer";
        }
    }
    if (message.contains("params") && !message["params"].is_object() && !message["params"].is_array()) {
        return "params must be an object or an array";
    }
    return std::nullopt;
}

} // namespace JsonRpc
