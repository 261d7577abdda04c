#include "mcp/StdioServer.h"
#include "mcp/IMessageHandler.h"
#include "mcp/JsonRpc.h"
#include "core/CancellationToken.h"
#include "utils/Logger.h"

namespace {
bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}
} // namespace

StdioServer::StdioServer(IMessageHandler& handler, Logger& logger, size_t maxMessageSize)
    : handler(handler), logger(logger), maxMessageSize(maxMessageSize) {}

void StdioServer::listen(const CancellationToken& token, IDuplexStream& stream) {
    std::string pending;
    size_t scanned = 0;   // bytes of pending already known to hold no newline
    char buffer[4096];

    while (!token.isCancelled()) {
        auto newline = pending.find('\n', scanned);
        if (newline != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            scanned = 0;
            processLine(line, stream);
            continue;
        }

        if (pending.size() > maxMessageSize) {
            throw TransportError("message exceeds " + std::to_string(maxMessageSize) + " bytes without a newline");
        }

        scanned = pending.size();
        size_t n = stream.read(buffer, sizeof(buffer));
        if (n == 0) {
            if (token.isCancelled()) {
                logger.debug("stdio listener cancelled");
                return;
            }
            if (pending.size() > maxMessageSize) {
                throw TransportError("message exceeds " + std::to_string(maxMessageSize) + " bytes without a newline");
            }
            // An unterminated last line is still a message
            if (!pending.empty()) {
                processLine(pending, stream);
            }
            logger.debug("stdin closed after " + std::to_string(handledCount) + " messages");
            return;
        }
        pending.append(buffer, n);
    }
    logger.debug("stdio listener cancelled");
}

void StdioServer::processLine(const std::string& rawLine, IDuplexStream& stream) {
    std::string line = rawLine;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (isBlank(line)) {
        return;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        logger.warn(std::string("failed to parse message: ") + e.what());
        writeMessage(JsonRpc::makeError(nullptr, JsonRpc::PARSE_ERROR, "Parse error"), stream);
        return;
    }

    auto response = dispatch(message);
    ++handledCount;
    if (response) {
        writeMessage(*response, stream);
    }
}

std::optional<nlohmann::json> StdioServer::dispatch(const nlohmann::json& message) {
    // A malformed message without an id still gets an error with a null id
    const bool notification = JsonRpc::isNotification(message) && !JsonRpc::validateRequest(message);
    try {
        return handler.handleMessage(message);
    } catch (const JsonRpc::RpcError& e) {
        logger.debug(std::string("request failed: ") + e.what());
        if (notification) return std::nullopt;
        return JsonRpc::makeError(JsonRpc::requestId(message), e.getCode(), e.what());
    } catch (const std::exception& e) {
        logger.error(std::string("handler failed: ") + e.what());
        if (notification) return std::nullopt;
        return JsonRpc::makeError(JsonRpc::requestId(message), JsonRpc::INTERNAL_ERROR, e.what());
    }
}

void StdioServer::writeMessage(const nlohmann::json& message, IDuplexStream& stream) {
    std::string data = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    data.push_back('\n');
    stream.write(data.data(), data.size());
}
