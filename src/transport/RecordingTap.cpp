#include "transport/RecordingTap.h"
#include "utils/Logger.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

void LoggerRecordSink::record(Direction direction, const char* data, size_t size) {
    std::string message = direction == Direction::Inbound
        ? "[stdin]: received " + std::to_string(size) + " bytes: "
        : "[stdout]: sending " + std::to_string(size) + " bytes: ";
    // Quoted and escaped so one record is always one log line
    message += nlohmann::json(std::string(data, size)).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    if (!logger.log(LogLevel::INFO, message)) {
        throw std::runtime_error("log destination rejected " + std::to_string(size) + " recorded bytes");
    }
}

RecordingTap::RecordingTap(IDuplexStream& inner, RecordSink& sink, Logger& logger)
    : inner(inner), sink(sink), logger(logger) {}

size_t RecordingTap::read(char* buffer, size_t size) {
    size_t n = inner.read(buffer, size);
    if (n > 0) {
        recordSafely(RecordSink::Direction::Inbound, buffer, n);
    }
    return n;
}

void RecordingTap::write(const char* data, size_t size) {
    if (size > 0) {
        recordSafely(RecordSink::Direction::Outbound, data, size);
    }
    inner.write(data, size);
}

void RecordingTap::recordSafely(RecordSink::Direction direction, const char* data, size_t size) {
    try {
        sink.record(direction, data, size);
    } catch (const std::exception& e) {
        size_t failures = ++failedRecords;
        // Warn on the first failure, then every 100th
        if (failures == 1 || failures % 100 == 0) {
            logger.warn("command logging failed (" + std::to_string(failures) + " records lost): " + e.what());
        }
    }
}
