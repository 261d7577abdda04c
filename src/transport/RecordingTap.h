#pragma once
#include "transport/IDuplexStream.h"
#include <atomic>
#include <string>

class Logger;

/**
 * @brief 录制目标
 */
class RecordSink {
public:
    enum class Direction {
        Inbound,   // read from the peer
        Outbound   // written to the peer
    };

    virtual ~RecordSink() = default;

    /**
     * @brief 追加一段跨越传输边界的字节
     * @throws std::exception 目标写入失败时 (由 RecordingTap 捕获)
     */
    virtual void record(Direction direction, const char* data, size_t size) = 0;
};

/**
 * @brief 把流量写入进程日志的录制目标
 *
 * 格式: [stdin]: received N bytes: "..." / [stdout]: sending N bytes: "..."
 * 载荷按 JSON 字符串转义, 换行不会拆开日志行。
 */
class LoggerRecordSink : public RecordSink {
public:
    explicit LoggerRecordSink(Logger& logger) : logger(logger) {}

    void record(Direction direction, const char* data, size_t size) override;

private:
    Logger& logger;
};

/**
 * @brief 录制包装流
 *
 * 对调用方完全透明: 字节内容和错误行为与被包装流一致,
 * 只是额外把每个字节按经过边界的顺序追加到 RecordSink。
 * 读方向在读到之后录制, 写方向在写出之前录制。
 * 录制失败只记一条警告, 绝不影响主通道。
 */
class RecordingTap : public IDuplexStream {
public:
    RecordingTap(IDuplexStream& inner, RecordSink& sink, Logger& logger);

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;

    size_t getFailedRecordCount() const { return failedRecords.load(); }

private:
    IDuplexStream& inner;
    RecordSink& sink;
    Logger& logger;
    std::atomic<size_t> failedRecords{0};

    void recordSafely(RecordSink::Direction direction, const char* data, size_t size);
};
