#pragma once
#include <string>
#include <functional>
#include <memory>
#include <mutex>
#include <fstream>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief 进程日志
 *
 * 输出到配置的日志文件 (追加模式), 未配置时输出到 stderr。
 * stdout 是 JSON-RPC 传输通道, 绝不写日志。
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    // Logs to stderr at INFO level
    Logger();

    /**
     * @brief 打开日志文件
     * @param path 日志文件路径, 为空时返回 stderr 日志
     * @throws std::runtime_error 无法打开文件时
     */
    static std::shared_ptr<Logger> open(const std::string& path);

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    LogLevel getLevel() const {
        std::lock_guard<std::mutex> lock(mtx);
        return minLevel;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    /**
     * @brief 写一条日志
     * @return 目标是否接受了这次写入 (低于级别被过滤时返回 true)
     */
    bool log(LogLevel level, const std::string& message);

    // Convenience methods
    bool debug(const std::string& m) { return log(LogLevel::DEBUG, m); }
    bool info(const std::string& m) { return log(LogLevel::INFO, m); }
    bool warn(const std::string& m) { return log(LogLevel::WARNING, m); }
    bool error(const std::string& m) { return log(LogLevel::ERROR, m); }

    const std::string& getPath() const { return path; }

private:
    mutable std::mutex mtx;
    LogCallback callback;
    LogLevel minLevel = LogLevel::INFO;
    std::string path;
    std::ofstream file;
    bool colorize = false;

    bool writeLine(LogLevel level, const std::string& message);
};

const char* logLevelName(LogLevel level);
