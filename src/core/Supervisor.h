#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

struct RunConfig;
class CancellationToken;
class InterruptListener;
class IDuplexStream;
class StdioServer;
class Analytics;
class Logger;

/**
 * @brief 生命周期管理
 *
 * 状态: Initializing → Running → ShuttingDown → Terminated
 *
 * run() 在后台线程启动消息循环, 然后等待 "令牌被取消" 与
 * "消息循环结束" 两者中先发生的一个, 由最先发生的事件决定关闭原因,
 * 立即进入关闭流程: 释放信号监听、关闭遥测 (保证恰好一次)、取消令牌。
 *
 * 取消策略: 消息循环是协作式可取消的。令牌在每条消息之间被检查,
 * FdDuplexStream 的阻塞读写同时等待令牌的唤醒句柄。
 * 因中断关闭时最多等待 loopGracePeriod; 若处理器仍在执行请求,
 * 后台线程被分离, run() 直接返回 (isLoopFinished() 为 false),
 * 调用方应随即结束进程而不析构循环仍在使用的对象。
 */
class Supervisor {
public:
    enum class State {
        Initializing,
        Running,
        ShuttingDown,
        Terminated
    };

    enum class Trigger {
        None,
        Interrupted,      // token cancelled (signal or caller)
        StreamClosed,     // loop returned normally
        TransportFailed   // loop threw
    };

    Supervisor(const RunConfig& config, Logger& logger, Analytics& analytics, StdioServer& server);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /**
     * @brief 运行一个会话直到关闭
     *
     * 只能调用一次。因中断而关闭时总是正常返回,
     * 即使消息循环随后报告了错误。
     * @throws TransportError 消息循环因传输错误结束时
     * @throws std::exception 进入 Running 之前的初始化失败
     */
    void run(CancellationToken& token, IDuplexStream& stream);

    State getState() const { return state.load(); }
    Trigger getTrigger() const { return trigger.load(); }

    // Enabled by default; tests that drive the token directly may turn it off
    void setInstallSignalHandlers(bool enabled) { installSignalHandlers = enabled; }

    void setLoopGracePeriod(std::chrono::milliseconds grace) { loopGracePeriod = grace; }

    // Valid after run() returns; false when the loop thread was left running
    bool isLoopFinished() const;

private:
    const RunConfig& config;
    Logger& logger;
    Analytics& analytics;
    StdioServer& server;

    std::atomic<State> state{State::Initializing};
    std::atomic<Trigger> trigger{Trigger::None};
    std::atomic<bool> started{false};
    bool installSignalHandlers = true;
    std::chrono::milliseconds loopGracePeriod{250};

    // Shared with the loop thread so it may outlive run()
    struct LoopState;
    std::shared_ptr<LoopState> loopState;

    std::unique_ptr<InterruptListener> interruptListener;
    std::once_flag telemetryClosed;

    static void serve(const RunConfig& config, Logger& logger, StdioServer& server,
                      CancellationToken& token, IDuplexStream& stream);
    void teardown();
};

const char* supervisorStateName(Supervisor::State state);
