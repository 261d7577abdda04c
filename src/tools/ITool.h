#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 通过 tools/call 暴露给客户端的工具
 *
 * 工具按 toolset 分组, 由 --toolsets 决定启用哪些组;
 * --read-only 时只注册 isReadOnly() 为 true 的工具。
 */
class ITool {
public:
    virtual ~ITool() = default;

    // Unique within a registry; used as the tools/call "name"
    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;

    // JSON Schema of the "arguments" object
    virtual nlohmann::json getSchema() const = 0;

    virtual std::string getToolset() const = 0;
    virtual bool isReadOnly() const = 0;

    /**
     * @brief 运行工具
     * @return {"content": [{"type": "text", "text": "..."}]}
     * @throws std::exception 失败时抛出, ToolRegistry 将其转换为 isError 结果
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
