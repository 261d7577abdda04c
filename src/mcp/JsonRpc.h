#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace JsonRpc {

constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

/**
 * @brief 请求级错误, 会被转换为 JSON-RPC error 响应而不是中断会话
 */
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), code(code) {}

    int getCode() const { return code; }

private:
    int code;
};

nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);

nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);

// A message without "id" gets no response
bool isNotification(const nlohmann::json& message);

// "id" of the message, or null when absent/unusable
nlohmann::json requestId(const nlohmann::json& message);

/**
 * @brief 校验 JSON-RPC 2.0 请求外形
 * @return 不合法时返回错误描述
 */
std::optional<std::string> validateRequest(const nlohmann::json& message);

} // namespace JsonRpc
