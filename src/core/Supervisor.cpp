#include "core/Supervisor.h"
#include "core/CancellationToken.h"
#include "core/InterruptListener.h"
#include "core/RunConfig.h"
#include "core/Version.h"
#include "mcp/StdioServer.h"
#include "telemetry/Analytics.h"
#include "transport/RecordingTap.h"
#include "utils/Logger.h"
#include <condition_variable>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

const char* supervisorStateName(Supervisor::State state) {
    switch (state) {
        case Supervisor::State::Initializing: return "Initializing";
        case Supervisor::State::Running: return "Running";
        case Supervisor::State::ShuttingDown: return "ShuttingDown";
        case Supervisor::State::Terminated: return "Terminated";
    }
    return "Unknown";
}

struct Supervisor::LoopState {
    enum class Event {
        None,
        Interrupted,
        LoopEnded
    };

    std::mutex mtx;
    std::condition_variable cv;
    std::promise<void> result;
    Event first = Event::None;   // whichever event was observed first
    bool finished = false;       // the loop thread no longer touches caller objects
};

Supervisor::Supervisor(const RunConfig& config, Logger& logger, Analytics& analytics, StdioServer& server)
    : config(config), logger(logger), analytics(analytics), server(server) {}

Supervisor::~Supervisor() = default;

bool Supervisor::isLoopFinished() const {
    if (!loopState) return false;
    std::lock_guard<std::mutex> lock(loopState->mtx);
    return loopState->finished;
}

void Supervisor::run(CancellationToken& token, IDuplexStream& stream) {
    using Event = LoopState::Event;

    if (started.exchange(true)) {
        throw std::logic_error("Supervisor::run may only be called once");
    }

    // Initializing
    try {
        analytics.track("mcp_server_started", {
            {"version", TFMCP_VERSION},
            {"commit", TFMCP_COMMIT},
            {"date", TFMCP_BUILD_DATE}
        });
        if (installSignalHandlers) {
            interruptListener = std::make_unique<InterruptListener>(token, logger);
        }
    } catch (...) {
        teardown();
        state = State::Terminated;
        throw;
    }

    auto shared = std::make_shared<LoopState>();
    loopState = shared;
    std::future<void> loopDone = shared->result.get_future();

    size_t subscription = token.subscribe([shared] {
        std::lock_guard<std::mutex> lock(shared->mtx);
        if (shared->first == Event::None) {
            shared->first = Event::Interrupted;
        }
        shared->cv.notify_all();
    });

    Event first = Event::None;
    std::thread loopThread;
    try {
        const RunConfig* cfg = &config;
        Logger* log = &logger;
        StdioServer* srv = &server;
        CancellationToken* tok = &token;
        IDuplexStream* io = &stream;
        loopThread = std::thread([shared, cfg, log, srv, tok, io] {
            std::exception_ptr error;
            std::string reason;
            try {
                serve(*cfg, *log, *srv, *tok, *io);
            } catch (const std::exception& e) {
                error = std::current_exception();
                reason = e.what();
            } catch (...) {
                error = std::current_exception();
                reason = "unknown error";
            }

            {
                std::lock_guard<std::mutex> lock(shared->mtx);
                if (error) {
                    shared->result.set_exception(error);
                } else {
                    shared->result.set_value();
                }
                if (shared->first == Event::None) {
                    shared->first = Event::LoopEnded;
                }
            }
            shared->cv.notify_all();

            if (error) {
                log->debug("message loop ended: " + reason);
            }
            {
                std::lock_guard<std::mutex> lock(shared->mtx);
                shared->finished = true;
            }
            shared->cv.notify_all();
        });
        state = State::Running;
        std::cerr << "HCP Terraform MCP Server running on stdio" << std::endl;

        std::unique_lock<std::mutex> lock(shared->mtx);
        shared->cv.wait(lock, [&] { return shared->first != Event::None; });
        first = shared->first;
    } catch (...) {
        token.unsubscribe(subscription);
        token.cancel();
        if (loopThread.joinable()) loopThread.join();
        teardown();
        state = State::Terminated;
        throw;
    }
    token.unsubscribe(subscription);

    // ShuttingDown: the first observed event decides the outcome
    state = State::ShuttingDown;
    std::exception_ptr failure;
    if (first == Event::Interrupted) {
        trigger = Trigger::Interrupted;
        logger.info("shutting down server...");
    } else {
        try {
            loopDone.get();
            trigger = Trigger::StreamClosed;
            logger.info("stdin closed, shutting down server...");
        } catch (...) {
            failure = std::current_exception();
            trigger = Trigger::TransportFailed;
        }
    }

    teardown();

    // Wakes the loop if it is still blocked in read or write
    token.cancel();

    if (trigger == Trigger::Interrupted) {
        bool finished;
        {
            std::unique_lock<std::mutex> lock(shared->mtx);
            finished = shared->cv.wait_for(lock, loopGracePeriod, [&] { return shared->finished; });
        }
        if (finished) {
            loopThread.join();
            try {
                loopDone.get();
            } catch (const std::exception& e) {
                logger.debug(std::string("ignoring listener error after interrupt: ") + e.what());
            }
        } else {
            logger.warn("message loop still busy after " + std::to_string(loopGracePeriod.count()) +
                        "ms, not waiting for it");
            loopThread.detach();
        }
    } else {
        loopThread.join();
    }

    state = State::Terminated;
    if (failure) {
        std::rethrow_exception(failure);
    }
}

void Supervisor::serve(const RunConfig& config, Logger& logger, StdioServer& server,
                       CancellationToken& token, IDuplexStream& stream) {
    if (!config.logCommands) {
        server.listen(token, stream);
        return;
    }

    LoggerRecordSink sink(logger);
    RecordingTap tap(stream, sink, logger);
    logger.info("command logging enabled");
    server.listen(token, tap);
}

void Supervisor::teardown() {
    interruptListener.reset();
    std::call_once(telemetryClosed, [this] {
        logger.debug("flushing analytics");
        analytics.close();
    });
}
