#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>

/**
 * @brief 配置错误: 启动前致命
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief 运行配置
 *
 * 启动时解析一次, 之后只读。
 */
struct RunConfig {
    bool readOnly = false;
    std::string logFile;             // empty: log to stderr
    bool logCommands = false;
    std::vector<std::string> enabledToolsets{"all"};

    std::string tfeToken;
    std::string tfeAddress;          // empty: https://app.terraform.io

    std::string analyticsWriteKey;   // empty: events are flushed nowhere
    std::string analyticsEndpoint = "https://api.segment.io";

    /**
     * @brief 从 JSON 配置文件合并设置
     *
     * 支持的键: read_only, log_file, enable_command_logging, toolsets,
     * tfe_address, segment_endpoint。未出现的键保持原值。
     * @throws ConfigError 文件无法读取或 JSON 非法时
     */
    void loadFile(const std::string& path);
};

/**
 * @brief 命令行解析结果
 */
struct CommandLine {
    std::string command;      // "stdio" or empty
    bool showVersion = false;
    bool showHelp = false;
    RunConfig config;
};

// Environment lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> processEnv(const std::string& name);

/**
 * @brief 解析命令行与环境变量
 *
 * 优先级: 命令行 > 环境变量 > --config 文件 > 默认值
 * @throws ConfigError 未知参数、缺少参数值或非法布尔值时
 */
CommandLine parseCommandLine(int argc, const char* const argv[], const EnvLookup& env = processEnv);

std::string usageText();

bool parseBool(const std::string& value);

std::vector<std::string> splitList(const std::string& value);
