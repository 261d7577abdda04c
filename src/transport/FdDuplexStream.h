#pragma once
#include "transport/IDuplexStream.h"
#include <unistd.h>

class CancellationToken;

/**
 * @brief 基于一对 POSIX 文件描述符的双工流 (默认 stdin / stdout)
 *
 * 读写前先 poll, 同时等待 CancellationToken 的唤醒句柄:
 * 取消后读返回 0 (视为流结束), 写抛出 TransportError。
 * 不持有描述符, 析构时不关闭。
 */
class FdDuplexStream : public IDuplexStream {
public:
    FdDuplexStream(int readFd = STDIN_FILENO, int writeFd = STDOUT_FILENO,
                   const CancellationToken* token = nullptr);

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;

private:
    int readFd;
    int writeFd;
    const CancellationToken* token;

    // false when the token fired before fd became ready
    bool waitFor(int fd, short events);
};
