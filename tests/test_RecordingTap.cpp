#include <gtest/gtest.h>
#include "transport/RecordingTap.h"
#include "mcp/StdioServer.h"
#include "mcp/IMessageHandler.h"
#include "mcp/JsonRpc.h"
#include "utils/Logger.h"
#include "TestSupport.h"
#include <filesystem>

namespace {
class EchoHandler : public IMessageHandler {
public:
    std::optional<nlohmann::json> handleMessage(const nlohmann::json& message) override {
        if (!message.contains("id")) return std::nullopt;
        return JsonRpc::makeResult(message["id"], {{"echo", message.value("method", "")}});
    }
};

class MemorySink : public RecordSink {
public:
    void record(Direction direction, const char* data, size_t size) override {
        entries.emplace_back(direction, std::string(data, size));
    }

    std::string joined(Direction direction) const {
        std::string out;
        for (const auto& [dir, bytes] : entries) {
            if (dir == direction) out += bytes;
        }
        return out;
    }

    std::vector<std::pair<Direction, std::string>> entries;
};

class FailingSink : public RecordSink {
public:
    void record(Direction, const char*, size_t) override {
        ++attempts;
        throw std::runtime_error("disk full");
    }
    int attempts = 0;
};
} // namespace

class RecordingTapTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger.setLevel(LogLevel::ERROR);
        input = request(1, "tools/list") + "not json\n" + request(2, "tools/call", {{"name", "x"}}) +
                "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n";
    }

    void runLoop(IDuplexStream& stream) {
        EchoHandler handler;
        StdioServer server(handler, logger);
        server.listen(token, stream);
    }

    Logger logger;
    CancellationToken token;
    std::string input;
};

TEST_F(RecordingTapTest, TrafficIsIdenticalWithAndWithoutTap) {
    MemoryDuplexStream plain(input, 11);
    runLoop(plain);

    MemoryDuplexStream inner(input, 11);
    MemorySink sink;
    RecordingTap tap(inner, sink, logger);
    runLoop(tap);

    EXPECT_EQ(inner.getDelivered(), plain.getDelivered());
    EXPECT_EQ(inner.getOutput(), plain.getOutput());
    EXPECT_FALSE(plain.getOutput().empty());
}

TEST_F(RecordingTapTest, RecordsEveryByteExactlyOnce) {
    MemoryDuplexStream inner(input, 5);
    MemorySink sink;
    RecordingTap tap(inner, sink, logger);
    runLoop(tap);

    EXPECT_EQ(sink.joined(RecordSink::Direction::Inbound), input);
    EXPECT_EQ(sink.joined(RecordSink::Direction::Outbound), inner.getOutput());
}

TEST_F(RecordingTapTest, RecordsInTransitOrder) {
    std::string first = request(1, "ping");
    std::string second = request(2, "ping");
    ASSERT_EQ(first.size(), second.size());

    MemoryDuplexStream inner(first + second, first.size());
    MemorySink sink;
    RecordingTap tap(inner, sink, logger);
    runLoop(tap);

    using D = RecordSink::Direction;
    ASSERT_EQ(sink.entries.size(), 4u);
    EXPECT_EQ(sink.entries[0].first, D::Inbound);
    EXPECT_EQ(sink.entries[0].second, first);
    EXPECT_EQ(sink.entries[1].first, D::Outbound);
    EXPECT_EQ(sink.entries[2].first, D::Inbound);
    EXPECT_EQ(sink.entries[2].second, second);
    EXPECT_EQ(sink.entries[3].first, D::Outbound);
}

TEST_F(RecordingTapTest, SinkFailureIsOnlyAWarning) {
    MemoryDuplexStream plain(input);
    runLoop(plain);

    std::vector<std::string> warnings;
    logger.setLevel(LogLevel::WARNING);
    logger.setCallback([&](LogLevel level, const std::string& msg) {
        if (level == LogLevel::WARNING && msg.find("command logging") != std::string::npos) {
            warnings.push_back(msg);
        }
    });

    MemoryDuplexStream inner(input);
    FailingSink sink;
    RecordingTap tap(inner, sink, logger);
    EXPECT_NO_THROW(runLoop(tap));

    EXPECT_EQ(inner.getOutput(), plain.getOutput());
    EXPECT_GT(sink.attempts, 0);
    EXPECT_EQ(tap.getFailedRecordCount(), static_cast<size_t>(sink.attempts));
    ASSERT_FALSE(warnings.empty());
    EXPECT_NE(warnings[0].find("disk full"), std::string::npos);
}

TEST_F(RecordingTapTest, WriteErrorsPassThroughUnchanged) {
    MemoryDuplexStream inner(request(1, "ping"));
    inner.failWritesAfter(0);
    MemorySink sink;
    RecordingTap tap(inner, sink, logger);

    EXPECT_THROW(runLoop(tap), TransportError);
    // The outbound bytes were recorded before the write was attempted
    EXPECT_FALSE(sink.joined(RecordSink::Direction::Outbound).empty());
}

TEST_F(RecordingTapTest, LoggerSinkWritesDirectionAndSize) {
    std::vector<std::string> lines;
    logger.setLevel(LogLevel::DEBUG);
    logger.setCallback([&](LogLevel, const std::string& msg) { lines.push_back(msg); });

    LoggerRecordSink sink(logger);
    sink.record(RecordSink::Direction::Inbound, "hello", 5);
    sink.record(RecordSink::Direction::Outbound, "{}\n", 3);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "[stdin]: received 5 bytes: \"hello\"");
    EXPECT_EQ(lines[1], "[stdout]: sending 3 bytes: \"{}\\n\"");
}

TEST_F(RecordingTapTest, LoggerSinkKeepsMultiMessageChunkOnOneLine) {
    std::vector<std::string> lines;
    logger.setLevel(LogLevel::DEBUG);
    logger.setCallback([&](LogLevel, const std::string& msg) { lines.push_back(msg); });

    const std::string chunk = request(1, "ping") + "\r\n" + request(2, "ping") + "\t\"tail\"";
    LoggerRecordSink sink(logger);
    sink.record(RecordSink::Direction::Inbound, chunk.data(), chunk.size());

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].find('\n'), std::string::npos);
    EXPECT_EQ(lines[0].find('\r'), std::string::npos);

    const std::string prefix = "[stdin]: received " + std::to_string(chunk.size()) + " bytes: ";
    ASSERT_EQ(lines[0].rfind(prefix, 0), 0u) << lines[0];
    auto payload = nlohmann::json::parse(lines[0].substr(prefix.size()));
    EXPECT_EQ(payload.get<std::string>(), chunk);
}

TEST_F(RecordingTapTest, UnwritableLogDestinationDoesNotBreakTraffic) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    auto fullLogger = Logger::open("/dev/full");
    LoggerRecordSink sink(*fullLogger);

    MemoryDuplexStream plain(input);
    runLoop(plain);

    MemoryDuplexStream inner(input);
    RecordingTap tap(inner, sink, *fullLogger);
    EXPECT_NO_THROW(runLoop(tap));

    EXPECT_EQ(inner.getOutput(), plain.getOutput());
    EXPECT_GT(tap.getFailedRecordCount(), 0u);
}
