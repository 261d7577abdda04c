#pragma once
#include <atomic>
#include <thread>
#include <signal.h>

class CancellationToken;
class Logger;

/**
 * @brief 把 SIGINT / SIGTERM 转换为 CancellationToken::cancel()
 *
 * 构造时安装信号处理器, 析构时恢复原处理器并停止监听线程 (RAII)。
 * 信号处理器只向自管道写一个字节, 由监听线程完成取消。
 * 同一时刻只允许存在一个实例。
 */
class InterruptListener {
public:
    /**
     * @throws std::logic_error 已有实例存在时
     * @throws std::runtime_error 无法创建管道或安装处理器时
     */
    InterruptListener(CancellationToken& token, Logger& logger);
    ~InterruptListener();

    InterruptListener(const InterruptListener&) = delete;
    InterruptListener& operator=(const InterruptListener&) = delete;

    // 0 if no signal has been received
    int getLastSignal() const { return lastSignal.load(); }

private:
    CancellationToken& token;
    Logger& logger;
    std::thread listenerThread;
    int stopPipe[2] = {-1, -1};
    std::atomic<int> lastSignal{0};
    struct sigaction previousInt{};
    struct sigaction previousTerm{};

    void listen();
    void closePipes();
};
