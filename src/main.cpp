#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <unistd.h>

#include "core/CancellationToken.h"
#include "core/RunConfig.h"
#include "core/Supervisor.h"
#include "core/Version.h"
#include "mcp/McpServer.h"
#include "mcp/StdioServer.h"
#include "net/HttpClientFactory.h"
#include "telemetry/SegmentAnalytics.h"
#include "tools/ServerInfoTool.h"
#include "tools/ToolRegistry.h"
#include "transport/FdDuplexStream.h"
#include "utils/Logger.h"

namespace {
const char* kDefaultTfeAddress = "https://app.terraform.io";

void printVersion() {
    std::cout << "HCP Terraform MCP Server" << std::endl;
    std::cout << "Version: " << TFMCP_VERSION << std::endl;
    std::cout << "Commit: " << TFMCP_COMMIT << std::endl;
    std::cout << "Build Date: " << TFMCP_BUILD_DATE << std::endl;
}

int runStdioServer(RunConfig cfg, Logger& logger) {
    logger.info("initializing analytics");
    std::unique_ptr<AnalyticsDelivery> delivery;
    if (!cfg.analyticsWriteKey.empty()) {
        HttpClientFactory httpFactory;
        delivery = std::make_unique<SegmentHttpDelivery>(httpFactory, cfg.analyticsEndpoint, cfg.analyticsWriteKey);
    } else {
        logger.debug("TFMCP_SEGMENT_WRITE_KEY not set, analytics events are discarded");
    }
    SegmentAnalytics analytics(logger, std::move(delivery));

    if (!cfg.tfeToken.empty()) {
        if (cfg.tfeAddress.empty()) {
            cfg.tfeAddress = kDefaultTfeAddress;
            logger.warn(std::string("HCP_TFE_ADDRESS not set, defaulting to ") + kDefaultTfeAddress);
        }
    } else {
        logger.warn("HCP_TFE_TOKEN not set, defaulting to non-authenticated client");
    }

    ToolRegistry registry(cfg.enabledToolsets, cfg.readOnly);
    registry.registerTool(std::make_unique<ServerInfoTool>(cfg));
    logger.info("registered " + std::to_string(registry.getToolCount()) + " tools" +
                (cfg.readOnly ? " (read-only)" : ""));

    McpServer handler(registry, analytics, logger);
    StdioServer server(handler, logger);

    CancellationToken token;
    FdDuplexStream stdio(STDIN_FILENO, STDOUT_FILENO, &token);

    Supervisor supervisor(cfg, logger, analytics, server);
    try {
        supervisor.run(token, stdio);
    } catch (const TransportError& e) {
        logger.error(std::string("error running server: ") + e.what());
        std::cerr << "failed to run stdio server: error running server: " << e.what() << std::endl;
        return 1;
    }
    if (!supervisor.isLoopFinished()) {
        // A handler still holds the objects on this stack; leave without unwinding
        logger.warn("exiting while a request is still in progress");
        std::cerr.flush();
        std::_Exit(0);
    }
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Failed to initialize: " << e.what() << std::endl << std::endl << usageText();
        return 1;
    }

    if (cmd.showVersion) {
        printVersion();
        return 0;
    }
    if (cmd.showHelp) {
        std::cout << usageText();
        return 0;
    }
    if (cmd.command.empty()) {
        std::cerr << "Failed to initialize: missing command" << std::endl << std::endl << usageText();
        return 1;
    }

    // A vanished peer must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    std::shared_ptr<Logger> logger;
    try {
        logger = Logger::open(cmd.config.logFile);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return 1;
    }

    try {
        return runStdioServer(cmd.config, *logger);
    } catch (const std::exception& e) {
        logger->error(std::string("failed to start: ") + e.what());
        std::cerr << "Failed to initialize: " << e.what() << std::endl;
        return 1;
    }
}
