#pragma once
#include "ITool.h"
#include "core/RunConfig.h"

/**
 * @brief 报告服务器版本与运行配置 (不含令牌本身)
 */
class ServerInfoTool : public ITool {
public:
    explicit ServerInfoTool(const RunConfig& config) : config(config) {}

    std::string getName() const override { return "get_server_info"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string getToolset() const override { return "server"; }
    bool isReadOnly() const override { return true; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const RunConfig& config;
};
