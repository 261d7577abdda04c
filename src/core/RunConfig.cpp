#include "core/RunConfig.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <nlohmann/json.hpp>

namespace {
const std::set<std::string> kBoolFlags = {"read-only", "enable-command-logging"};
const std::set<std::string> kValueFlags = {"toolsets", "log-file", "config"};

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}
} // namespace

bool parseBool(const std::string& value) {
    std::string v = trim(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty()) return false;
    throw ConfigError("invalid boolean value: " + value);
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::optional<std::string> processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

void RunConfig::loadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("Could not open config file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    f.close();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("JSON Parse Error in " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Config file must contain a JSON object: " + path);
    }

    try {
        readOnly = j.value("read_only", readOnly);
        logFile = j.value("log_file", logFile);
        logCommands = j.value("enable_command_logging", logCommands);
        tfeAddress = j.value("tfe_address", tfeAddress);
        analyticsEndpoint = j.value("segment_endpoint", analyticsEndpoint);
        if (j.contains("toolsets")) {
            if (j["toolsets"].is_string()) {
                enabledToolsets = splitList(j["toolsets"].get<std::string>());
            } else {
                enabledToolsets = j["toolsets"].get<std::vector<std::string>>();
            }
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError("Invalid value in " + path + ": " + e.what());
    }
}

std::string usageText() {
    return
        "HCP Terraform MCP Server\n"
        "\n"
        "Usage:\n"
        "  terraform-mcp-server stdio [flags]   Start a server that communicates via standard input/output streams\n"
        "  terraform-mcp-server --version\n"
        "\n"
        "Flags:\n"
        "      --toolsets strings          Comma separated list of groups of tools to allow (default \"all\")\n"
        "      --read-only                 Restrict the server to read-only operations\n"
        "      --log-file string           Path to log file\n"
        "      --enable-command-logging    Log all command requests and responses to the log file\n"
        "      --config string             Path to a JSON config file\n"
        "  -v, --version                   Print version information\n"
        "  -h, --help                      Print this help\n"
        "\n"
        "Environment:\n"
        "  TFMCP_TOOLSETS, TFMCP_READ_ONLY, TFMCP_LOG_FILE, TFMCP_ENABLE_COMMAND_LOGGING,\n"
        "  HCP_TFE_TOKEN, HCP_TFE_ADDRESS, TFMCP_SEGMENT_WRITE_KEY, TFMCP_SEGMENT_ENDPOINT\n";
}

CommandLine parseCommandLine(int argc, const char* const argv[], const EnvLookup& env) {
    CommandLine cmd;
    std::map<std::string, std::string> flags;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--version") {
            cmd.showVersion = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            cmd.showHelp = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            if (!cmd.command.empty()) {
                throw ConfigError("unexpected argument: " + arg);
            }
            if (arg != "stdio") {
                throw ConfigError("unknown command: " + arg);
            }
            cmd.command = arg;
            continue;
        }

        std::string name = arg.substr(2);
        std::optional<std::string> value;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (kBoolFlags.count(name)) {
            flags[name] = value ? *value : "true";
        } else if (kValueFlags.count(name)) {
            if (!value) {
                if (i + 1 >= argc) {
                    throw ConfigError("flag needs an argument: --" + name);
                }
                value = argv[++i];
            }
            flags[name] = *value;
        } else {
            throw ConfigError("unknown flag: --" + name);
        }
    }

    RunConfig& cfg = cmd.config;

    if (flags.count("config")) {
        cfg.loadFile(flags["config"]);
    }

    if (auto v = env("TFMCP_TOOLSETS")) cfg.enabledToolsets = splitList(*v);
    if (auto v = env("TFMCP_READ_ONLY")) cfg.readOnly = parseBool(*v);
    if (auto v = env("TFMCP_LOG_FILE")) cfg.logFile = *v;
    if (auto v = env("TFMCP_ENABLE_COMMAND_LOGGING")) cfg.logCommands = parseBool(*v);
    if (auto v = env("HCP_TFE_TOKEN")) cfg.tfeToken = *v;
    if (auto v = env("HCP_TFE_ADDRESS")) cfg.tfeAddress = *v;
    if (auto v = env("TFMCP_SEGMENT_WRITE_KEY")) cfg.analyticsWriteKey = *v;
    if (auto v = env("TFMCP_SEGMENT_ENDPOINT")) cfg.analyticsEndpoint = *v;

    if (flags.count("toolsets")) cfg.enabledToolsets = splitList(flags["toolsets"]);
    if (flags.count("read-only")) cfg.readOnly = parseBool(flags["read-only"]);
    if (flags.count("log-file")) cfg.logFile = flags["log-file"];
    if (flags.count("enable-command-logging")) cfg.logCommands = parseBool(flags["enable-command-logging"]);

    if (cfg.enabledToolsets.empty()) {
        cfg.enabledToolsets = {"all"};
    }
    return cmd;
}
