#include "telemetry/SegmentAnalytics.h"
#include "net/HttpClientFactory.h"
#include "core/Version.h"
#include "utils/Logger.h"
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace {
std::string randomHex(size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(digits[dist(gen)]);
    }
    return out;
}
} // namespace

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

SegmentHttpDelivery::SegmentHttpDelivery(const HttpClientFactory& factory, const std::string& endpoint,
                                         const std::string& writeKey)
    : client(factory.create(endpoint)), writeKey(writeKey) {
    client->set_basic_auth(writeKey, "");
}

SegmentHttpDelivery::~SegmentHttpDelivery() = default;

void SegmentHttpDelivery::deliver(const nlohmann::json& batch) {
    auto res = client->Post("/v1/batch", batch.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("segment request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error("segment responded with HTTP " + std::to_string(res->status));
    }
}

SegmentAnalytics::SegmentAnalytics(Logger& logger, std::unique_ptr<AnalyticsDelivery> delivery)
    : SegmentAnalytics(logger, std::move(delivery), Options{}) {}

SegmentAnalytics::SegmentAnalytics(Logger& logger, std::unique_ptr<AnalyticsDelivery> delivery, Options options)
    : logger(logger), delivery(std::move(delivery)), options(std::move(options)) {
    if (this->options.batchSize == 0) {
        this->options.batchSize = 1;
    }
    if (this->options.anonymousId.empty()) {
        this->options.anonymousId = randomHex(32);
    }
    worker = std::thread(&SegmentAnalytics::run, this);
}

SegmentAnalytics::~SegmentAnalytics() {
    close();
}

void SegmentAnalytics::track(const std::string& event, const nlohmann::json& properties) {
    nlohmann::json message = {
        {"type", "track"},
        {"event", event},
        {"properties", properties.is_null() ? nlohmann::json::object() : properties},
        {"anonymousId", options.anonymousId},
        {"messageId", randomHex(32)},
        {"timestamp", isoTimestamp(std::chrono::system_clock::now())},
        {"context", {{"library", {{"name", TFMCP_SERVER_NAME}, {"version", TFMCP_VERSION}}}}}
    };

    bool overflow = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (closing) {
            ++dropped;
            return;
        }
        if (queue.size() >= options.maxQueueSize) {
            ++dropped;
            overflow = true;
        } else {
            queue.push_back(std::move(message));
            if (queue.size() >= options.batchSize) {
                wake.notify_one();
            }
        }
    }
    if (overflow) {
        logger.warn("analytics queue full, dropping event " + event);
    }
}

void SegmentAnalytics::close() {
    {
        std::unique_lock<std::mutex> lock(mtx);
        if (closing) {
            return;
        }
        closing = true;
        wake.notify_all();

        bool flushed = drained.wait_for(lock, options.closeTimeout, [this] {
            return queue.empty() && !inFlight;
        });
        if (!flushed) {
            size_t lost = queue.size();
            dropped += lost;
            queue.clear();
            lock.unlock();
            logger.warn("analytics flush timed out, dropping " + std::to_string(lost) + " events");
            lock.lock();
        }
        stopping = true;
        wake.notify_all();
    }

    if (worker.joinable()) {
        worker.join();
    }
    logger.debug("analytics closed: " + std::to_string(delivered.load()) + " delivered, " +
                 std::to_string(dropped.load()) + " dropped");
}

void SegmentAnalytics::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (true) {
        wake.wait_for(lock, options.flushInterval, [this] {
            return stopping || queue.size() >= options.batchSize || (closing && !queue.empty());
        });
        if (stopping) {
            break;
        }
        if (queue.empty()) {
            if (closing) drained.notify_all();
            continue;
        }

        std::deque<nlohmann::json> batch;
        while (!queue.empty() && batch.size() < options.batchSize) {
            batch.push_back(std::move(queue.front()));
            queue.pop_front();
        }
        inFlight = true;
        lock.unlock();
        deliverBatch(std::move(batch));
        lock.lock();
        inFlight = false;

        if (queue.empty()) {
            drained.notify_all();
        }
    }
}

void SegmentAnalytics::deliverBatch(std::deque<nlohmann::json> events) {
    size_t count = events.size();
    if (!delivery) {
        dropped += count;
        logger.debug("analytics disabled, discarding " + std::to_string(count) + " events");
        return;
    }

    nlohmann::json payload = {
        {"batch", nlohmann::json::array()},
        {"sentAt", isoTimestamp(std::chrono::system_clock::now())}
    };
    for (auto& e : events) {
        payload["batch"].push_back(std::move(e));
    }

    try {
        delivery->deliver(payload);
        delivered += count;
    } catch (const std::exception& e) {
        dropped += count;
        logger.warn(std::string("analytics delivery failed: ") + e.what());
    }
}
