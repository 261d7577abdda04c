#include "transport/FdDuplexStream.h"
#include "core/CancellationToken.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <poll.h>

namespace {
// Writes no larger than PIPE_BUF never block once poll reports POLLOUT
constexpr size_t kMaxWriteChunk = 4096;
}

FdDuplexStream::FdDuplexStream(int readFd, int writeFd, const CancellationToken* token)
    : readFd(readFd), writeFd(writeFd), token(token) {}

bool FdDuplexStream::waitFor(int fd, short events) {
    pollfd fds[2] = {
        {fd, events, 0},
        {token ? token->getWaitHandle() : -1, POLLIN, 0}
    };

    while (true) {
        if (token && token->isCancelled()) {
            return false;
        }
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (fds[0].revents != 0) {
            // Readiness, hangup and errors are all reported by the following read/write
            return true;
        }
        if (fds[1].revents != 0) {
            return false;
        }
    }
}

size_t FdDuplexStream::read(char* buffer, size_t size) {
    if (size == 0) return 0;
    while (true) {
        if (!waitFor(readFd, POLLIN)) {
            return 0;
        }
        ssize_t n = ::read(readFd, buffer, size);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        }
        throw TransportError(std::string("read failed: ") + std::strerror(errno));
    }
}

void FdDuplexStream::write(const char* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        if (!waitFor(writeFd, POLLOUT)) {
            throw TransportError("write cancelled");
        }
        size_t chunk = std::min(kMaxWriteChunk, size - written);
        ssize_t n = ::write(writeFd, data + written, chunk);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw TransportError(std::string("write failed: ") + std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
}
