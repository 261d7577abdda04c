#include "ToolRegistry.h"
#include <algorithm>
#include <stdexcept>

ToolRegistry::ToolRegistry(std::vector<std::string> enabledToolsets, bool readOnly)
    : enabledToolsets(std::move(enabledToolsets)), readOnly(readOnly) {}

bool ToolRegistry::isToolsetEnabled(const std::string& toolset) const {
    return std::any_of(enabledToolsets.begin(), enabledToolsets.end(), [&](const std::string& t) {
        return t == "all" || t == toolset;
    });
}

bool ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return false;
    if (!isToolsetEnabled(tool->getToolset())) return false;
    if (readOnly && !tool->isReadOnly()) return false;

    // Later registrations replace earlier ones with the same name
    std::string name = tool->getName();
    tools[name] = std::move(tool);
    return true;
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

nlohmann::json ToolRegistry::listTools() const {
    nlohmann::json list = nlohmann::json::array();

    for (const auto& [name, tool] : tools) {
        nlohmann::json def;
        def["name"] = name;
        def["description"] = tool->getDescription();
        def["inputSchema"] = tool->getSchema();
        def["annotations"] = {{"readOnlyHint", tool->isReadOnly()}};
        list.push_back(def);
    }

    return list;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) {
    ITool* tool = getTool(name);
    if (!tool) {
        throw std::out_of_range("Tool not found: " + name);
    }

    try {
        return tool->execute(args);
    } catch (const std::exception& e) {
        nlohmann::json error;
        error["content"] = nlohmann::json::array({
            {{"type", "text"}, {"text", std::string("Tool execution failed: ") + e.what()}}
        });
        error["isError"] = true;
        return error;
    }
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
