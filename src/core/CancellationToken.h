#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <mutex>

/**
 * @brief 一次性取消信号
 *
 * cancel() 之后永久处于已取消状态。除了标志位, 还提供一个可 poll 的
 * 文件描述符 (getWaitHandle), 取消后变为可读, 供阻塞 I/O 同时等待取消。
 *
 * 订阅的回调在内部锁内执行, 回调中不得再调用本对象。
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    /**
     * @throws std::runtime_error 无法创建唤醒管道时
     */
    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Idempotent and thread safe
    void cancel();

    bool isCancelled() const { return cancelled.load(std::memory_order_acquire); }

    int getWaitHandle() const { return pipeFds[0]; }

    /**
     * @brief 注册取消回调
     *
     * 已取消时立即在当前线程调用。
     * @return 订阅 id, 用于 unsubscribe
     */
    size_t subscribe(Callback callback);

    void unsubscribe(size_t id);

private:
    std::atomic<bool> cancelled{false};
    std::mutex mtx;
    std::map<size_t, Callback> callbacks;
    size_t nextId = 1;
    int pipeFds[2] = {-1, -1};
};
