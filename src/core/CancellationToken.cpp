#include "core/CancellationToken.h"
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <string>
#include <unistd.h>
#include <fcntl.h>

CancellationToken::CancellationToken() {
    if (pipe(pipeFds) != 0) {
        throw std::runtime_error(std::string("failed to create cancellation pipe: ") + std::strerror(errno));
    }
    fcntl(pipeFds[0], F_SETFD, FD_CLOEXEC);
    fcntl(pipeFds[1], F_SETFD, FD_CLOEXEC);
}

CancellationToken::~CancellationToken() {
    close(pipeFds[0]);
    close(pipeFds[1]);
}

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mtx);
    if (cancelled.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // The byte is never drained so the read end stays readable
    const char wake = 1;
    ssize_t n;
    do {
        n = write(pipeFds[1], &wake, 1);
    } while (n < 0 && errno == EINTR);

    for (auto& [id, callback] : callbacks) {
        callback();
    }
    callbacks.clear();
}

size_t CancellationToken::subscribe(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!isCancelled()) {
            size_t id = nextId++;
            callbacks[id] = std::move(callback);
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(mtx);
    callbacks.erase(id);
}
