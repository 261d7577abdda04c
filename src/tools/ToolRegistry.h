#pragma once
#include <string>
#include <memory>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief 工具注册中心
 *
 * 统一管理所有工具的注册、查找和执行。
 * 注册时按启用的 toolset 和只读模式过滤。
 */
class ToolRegistry {
public:
    /**
     * @param enabledToolsets 启用的工具组, 包含 "all" 时全部启用
     * @param readOnly 只读模式, 拒绝非只读工具
     */
    explicit ToolRegistry(std::vector<std::string> enabledToolsets = {"all"}, bool readOnly = false);
    ~ToolRegistry() = default;

    /**
     * @brief 注册一个工具
     * @param tool 工具实例 (unique_ptr 转移所有权)
     * @return 被过滤掉时返回 false
     */
    bool registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief 获取工具实例
     * @return 工具指针 (如果不存在返回 nullptr)
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief 列出所有工具定义, 按名称排序
     *
     * 格式 (MCP tools/list):
     * [
     *   {
     *     "name": "tool_name",
     *     "description": "...",
     *     "inputSchema": { JSON Schema },
     *     "annotations": {"readOnlyHint": true}
     *   }
     * ]
     */
    nlohmann::json listTools() const;

    /**
     * @brief 执行工具
     *
     * 工具抛出的异常被转换为:
     * {"content": [{"type": "text", "text": "..."}], "isError": true}
     * @throws std::out_of_range 工具不存在时
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

    bool isToolsetEnabled(const std::string& toolset) const;

private:
    std::vector<std::string> enabledToolsets;
    bool readOnly;
    std::map<std::string, std::unique_ptr<ITool>> tools;
};
