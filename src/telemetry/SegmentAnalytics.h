#pragma once
#include "telemetry/Analytics.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

class Logger;
class HttpClientFactory;

namespace httplib {
class Client;
}

/**
 * @brief 批量事件的投递目标
 */
class AnalyticsDelivery {
public:
    virtual ~AnalyticsDelivery() = default;

    /**
     * @param batch {"batch": [...], "sentAt": "..."}
     * @throws std::exception 投递失败时 (该批次被丢弃)
     */
    virtual void deliver(const nlohmann::json& batch) = 0;
};

/**
 * @brief 通过 Segment HTTP API (POST /v1/batch) 投递
 */
class SegmentHttpDelivery : public AnalyticsDelivery {
public:
    SegmentHttpDelivery(const HttpClientFactory& factory, const std::string& endpoint, const std::string& writeKey);
    ~SegmentHttpDelivery() override;

    void deliver(const nlohmann::json& batch) override;

private:
    std::unique_ptr<httplib::Client> client;
    std::string writeKey;
};

/**
 * @brief Segment 风格的遥测实现
 *
 * track 只入队; 后台线程按批次 (batchSize) 或定时 (flushInterval) 投递。
 * close 等待队列清空, 最多等待 closeTimeout, 然后停止后台线程。
 * delivery 为空时事件在出队后被丢弃。
 */
class SegmentAnalytics : public Analytics {
public:
    struct Options {
        size_t batchSize = 20;
        size_t maxQueueSize = 1000;
        std::chrono::milliseconds flushInterval{5000};
        std::chrono::milliseconds closeTimeout{5000};
        std::string anonymousId;   // generated when empty
    };

    SegmentAnalytics(Logger& logger, std::unique_ptr<AnalyticsDelivery> delivery);
    SegmentAnalytics(Logger& logger, std::unique_ptr<AnalyticsDelivery> delivery, Options options);
    ~SegmentAnalytics() override;

    SegmentAnalytics(const SegmentAnalytics&) = delete;
    SegmentAnalytics& operator=(const SegmentAnalytics&) = delete;

    void track(const std::string& event, const nlohmann::json& properties) override;
    void close() override;

    size_t getDeliveredCount() const { return delivered.load(); }
    size_t getDroppedCount() const { return dropped.load(); }
    const std::string& getAnonymousId() const { return options.anonymousId; }

private:
    Logger& logger;
    std::unique_ptr<AnalyticsDelivery> delivery;
    Options options;

    std::mutex mtx;
    std::condition_variable wake;
    std::condition_variable drained;
    std::deque<nlohmann::json> queue;
    bool inFlight = false;
    bool closing = false;
    bool stopping = false;
    std::atomic<size_t> delivered{0};
    std::atomic<size_t> dropped{0};
    std::thread worker;

    void run();
    void deliverBatch(std::deque<nlohmann::json> events);
};

/**
 * @brief ISO-8601 UTC 时间戳, 毫秒精度
 */
std::string isoTimestamp(std::chrono::system_clock::time_point tp);
