#include "ServerInfoTool.h"
#include "core/Version.h"

std::string ServerInfoTool::getDescription() const {
    return "Returns the server version, build information and the active configuration "
           "(read-only mode, enabled toolsets, HCP Terraform address).";
}

nlohmann::json ServerInfoTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };
}

nlohmann::json ServerInfoTool::execute(const nlohmann::json& args) {
    (void)args;
    nlohmann::json info = {
        {"name", TFMCP_SERVER_NAME},
        {"version", TFMCP_VERSION},
        {"commit", TFMCP_COMMIT},
        {"date", TFMCP_BUILD_DATE},
        {"read_only", config.readOnly},
        {"toolsets", config.enabledToolsets},
        {"tfe_address", config.tfeAddress.empty() ? "https://app.terraform.io" : config.tfeAddress},
        {"tfe_authenticated", !config.tfeToken.empty()}
    };

    nlohmann::json result;
    result["content"] = nlohmann::json::array({
        {{"type", "text"}, {"text", info.dump(2)}}
    });
    return result;
}
