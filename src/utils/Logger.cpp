#include "utils/Logger.h"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <unistd.h>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    std::string timestamp() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&now, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "[%Y-%m-%d %H:%M:%S] ");
        return ss.str();
    }
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Logger::Logger() : colorize(isatty(STDERR_FILENO) == 1) {}

std::shared_ptr<Logger> Logger::open(const std::string& path) {
    auto logger = std::make_shared<Logger>();
    if (path.empty()) {
        return logger;
    }

    logger->file.open(path, std::ios::out | std::ios::app);
    if (!logger->file.is_open()) {
        throw std::runtime_error("failed to open log file: " + path + ": " + std::strerror(errno));
    }
    logger->path = path;
    logger->colorize = false;
    logger->minLevel = LogLevel::DEBUG;
    return logger;
}

bool Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx);
    if (level < minLevel) {
        return true;
    }

    bool ok = writeLine(level, message);
    if (callback) {
        callback(level, message);
    }
    return ok;
}

bool Logger::writeLine(LogLevel level, const std::string& message) {
    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    if (file.is_open()) {
        file << timestamp() << "[" << logLevelName(level) << "] " << trimmedMsg << '\n';
        file.flush();
        if (!file.good()) {
            file.clear();
            return false;
        }
        return true;
    }

    std::string prefix = std::string("[") + logLevelName(level) + "] ";
    if (colorize) {
        switch (level) {
            case LogLevel::DEBUG: prefix = GRAY + prefix + RESET; break;
            case LogLevel::INFO: prefix = CYAN + prefix + RESET; break;
            case LogLevel::WARNING: prefix = YELLOW + prefix + RESET; break;
            case LogLevel::ERROR: prefix = RED + BOLD + prefix + RESET; break;
        }
    }
    std::cerr << timestamp() << prefix << trimmedMsg << std::endl;
    return static_cast<bool>(std::cerr);
}
