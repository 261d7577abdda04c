#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @brief 传输层错误 (读失败, 写失败, 帧过大)
 *
 * 对会话是致命的: 会终止消息循环。
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief 双工字节流接口
 *
 * 只负责字节, 不负责分帧。消息循环只面向此接口编写,
 * 原始 stdio 与录制包装都是它的实现。
 */
class IDuplexStream {
public:
    virtual ~IDuplexStream() = default;

    /**
     * @brief 读取最多 size 个字节
     * @return 实际读取的字节数, 0 表示流结束
     * @throws TransportError 读失败时
     */
    virtual size_t read(char* buffer, size_t size) = 0;

    /**
     * @brief 写出全部字节
     * @throws TransportError 写失败时
     */
    virtual void write(const char* data, size_t size) = 0;
};
