#include <gtest/gtest.h>
#include "mcp/McpServer.h"
#include "mcp/JsonRpc.h"
#include "tools/ServerInfoTool.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include "TestSupport.h"

namespace {
class ExplodingTool : public ITool {
public:
    std::string getName() const override { return "apply_workspace"; }
    std::string getDescription() const override { return "Always fails"; }
    nlohmann::json getSchema() const override { return {{"type", "object"}}; }
    std::string getToolset() const override { return "workspaces"; }
    bool isReadOnly() const override { return false; }
    nlohmann::json execute(const nlohmann::json&) override {
        throw std::runtime_error("workspace is locked");
    }
};

nlohmann::json message(const std::string& text) {
    return nlohmann::json::parse(text);
}
} // namespace

class McpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger.setLevel(LogLevel::ERROR);
        config.tfeToken = "secret-token";
        registry.registerTool(std::make_unique<ServerInfoTool>(config));
        registry.registerTool(std::make_unique<ExplodingTool>());
    }

    nlohmann::json call(const nlohmann::json& msg) {
        auto response = server.handleMessage(msg);
        EXPECT_TRUE(response.has_value());
        return response.value_or(nlohmann::json());
    }

    RunConfig config;
    Logger logger;
    CountingAnalytics analytics;
    ToolRegistry registry;
    McpServer server{registry, analytics, logger};
};

TEST_F(McpServerTest, InitializeNegotiatesProtocolVersion) {
    auto response = call(message(R"({"jsonrpc":"2.0","id":1,"method":"initialize",
        "params":{"protocolVersion":"2025-03-26","clientInfo":{"name":"test-client"}}})"));

    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["result"]["protocolVersion"], "2025-03-26");
    EXPECT_EQ(response["result"]["serverInfo"]["name"], "terraform-mcp-server");
    EXPECT_TRUE(response["result"]["capabilities"].contains("tools"));
}

TEST_F(McpServerTest, UnknownProtocolVersionFallsBackToDefault) {
    auto response = call(nlohmann::json::parse(request(2, "initialize", {{"protocolVersion", "1999-01-01"}})));
    EXPECT_EQ(response["result"]["protocolVersion"], std::string(McpServer::kProtocolVersion));
}

TEST_F(McpServerTest, InitializedNotificationHasNoResponse) {
    EXPECT_FALSE(server.isInitialized());
    auto response = server.handleMessage(message(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    EXPECT_FALSE(response.has_value());
    EXPECT_TRUE(server.isInitialized());
}

TEST_F(McpServerTest, PingReturnsEmptyObject) {
    auto response = call(nlohmann::json::parse(request(9, "ping")));
    EXPECT_EQ(response["id"], 9);
    EXPECT_TRUE(response["result"].is_object());
    EXPECT_TRUE(response["result"].empty());
}

TEST_F(McpServerTest, ToolsListIsSortedWithAnnotations) {
    auto response = call(nlohmann::json::parse(request(2, "tools/list")));
    const auto& tools = response["result"]["tools"];

    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "apply_workspace");
    EXPECT_EQ(tools[1]["name"], "get_server_info");
    EXPECT_EQ(tools[1]["annotations"]["readOnlyHint"], true);
    EXPECT_TRUE(tools[1].contains("inputSchema"));
}

TEST_F(McpServerTest, ToolsCallReturnsContentAndTracksSuccess) {
    auto response = call(nlohmann::json::parse(request(3, "tools/call", {{"name", "get_server_info"}})));

    const auto& content = response["result"]["content"];
    ASSERT_EQ(content.size(), 1u);
    auto info = nlohmann::json::parse(content[0]["text"].get<std::string>());
    EXPECT_EQ(info["name"], "terraform-mcp-server");
    EXPECT_EQ(info["tfe_authenticated"], true);
    EXPECT_EQ(info["tfe_address"], "https://app.terraform.io");
    EXPECT_EQ(content[0]["text"].get<std::string>().find("secret-token"), std::string::npos);

    auto events = analytics.getEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].first, "tool_called");
    EXPECT_EQ(events[0].second["tool"], "get_server_info");
    EXPECT_EQ(events[0].second["success"], true);
}

TEST_F(McpServerTest, FailingToolIsReportedAsToolError) {
    auto response = call(nlohmann::json::parse(request(4, "tools/call", {{"name", "apply_workspace"}})));

    EXPECT_FALSE(response.contains("error"));
    EXPECT_EQ(response["result"]["isError"], true);
    EXPECT_NE(response["result"]["content"][0]["text"].get<std::string>().find("workspace is locked"),
              std::string::npos);
    EXPECT_EQ(analytics.getEvents().at(0).second["success"], false);
}

TEST_F(McpServerTest, UnknownToolIsInvalidParams) {
    try {
        server.handleMessage(nlohmann::json::parse(request(5, "tools/call", {{"name", "nope"}})));
        FAIL() << "expected RpcError";
    } catch (const JsonRpc::RpcError& e) {
        EXPECT_EQ(e.getCode(), JsonRpc::INVALID_PARAMS);
        EXPECT_NE(std::string(e.what()).find("nope"), std::string::npos);
    }
    EXPECT_EQ(analytics.countEvents("tool_called"), 1u);
}

TEST_F(McpServerTest, MissingToolNameIsInvalidParams) {
    try {
        server.handleMessage(nlohmann::json::parse(request(6, "tools/call")));
        FAIL() << "expected RpcError";
    } catch (const JsonRpc::RpcError& e) {
        EXPECT_EQ(e.getCode(), JsonRpc::INVALID_PARAMS);
    }
}

TEST_F(McpServerTest, NonObjectArgumentsAreInvalidParams) {
    auto msg = nlohmann::json::parse(request(7, "tools/call", {{"name", "get_server_info"}, {"arguments", "x"}}));
    try {
        server.handleMessage(msg);
        FAIL() << "expected RpcError";
    } catch (const JsonRpc::RpcError& e) {
        EXPECT_EQ(e.getCode(), JsonRpc::INVALID_PARAMS);
    }
}

TEST_F(McpServerTest, UnknownMethodIsMethodNotFound) {
    try {
        server.handleMessage(nlohmann::json::parse(request(8, "resources/list")));
        FAIL() << "expected RpcError";
    } catch (const JsonRpc::RpcError& e) {
        EXPECT_EQ(e.getCode(), JsonRpc::METHOD_NOT_FOUND);
    }
}

TEST_F(McpServerTest, MalformedRequestIsInvalidRequest) {
    try {
        server.handleMessage(message(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"));
        FAIL() << "expected RpcError";
    } catch (const JsonRpc::RpcError& e) {
        EXPECT_EQ(e.getCode(), JsonRpc::INVALID_REQUEST);
    }
}

TEST_F(McpServerTest, UnknownNotificationIsIgnored) {
    auto response = server.handleMessage(message(R"({"jsonrpc":"2.0","method":"notifications/cancelled"})"));
    EXPECT_FALSE(response.has_value());
    EXPECT_FALSE(server.isInitialized());
}
