#include "core/InterruptListener.h"
#include "core/CancellationToken.h"
#include "utils/Logger.h"
#include <stdexcept>
#include <string>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

namespace {
// Written from the signal handler, so it has to be a plain global
volatile sig_atomic_t g_signalWriteFd = -1;
int g_signalPipe[2] = {-1, -1};
std::atomic<bool> g_listenerActive{false};

extern "C" void onInterrupt(int signo) {
    int savedErrno = errno;
    int fd = g_signalWriteFd;
    if (fd >= 0) {
        unsigned char byte = static_cast<unsigned char>(signo);
        ssize_t ignored = write(fd, &byte, 1);
        (void)ignored;
    }
    errno = savedErrno;
}

bool makePipe(int fds[2]) {
    if (pipe(fds) != 0) return false;
    for (int i = 0; i < 2; ++i) {
        fcntl(fds[i], F_SETFD, FD_CLOEXEC);
    }
    fcntl(fds[1], F_SETFL, fcntl(fds[1], F_GETFL) | O_NONBLOCK);
    return true;
}
} // namespace

InterruptListener::InterruptListener(CancellationToken& token, Logger& logger)
    : token(token), logger(logger) {
    if (g_listenerActive.exchange(true)) {
        throw std::logic_error("an interrupt listener is already installed");
    }

    if (!makePipe(g_signalPipe)) {
        g_listenerActive = false;
        throw std::runtime_error(std::string("failed to create signal pipe: ") + std::strerror(errno));
    }
    if (!makePipe(stopPipe)) {
        int err = errno;
        close(g_signalPipe[0]);
        close(g_signalPipe[1]);
        g_signalPipe[0] = g_signalPipe[1] = -1;
        g_listenerActive = false;
        throw std::runtime_error(std::string("failed to create signal pipe: ") + std::strerror(err));
    }
    g_signalWriteFd = g_signalPipe[1];

    struct sigaction action{};
    action.sa_handler = onInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (sigaction(SIGINT, &action, &previousInt) != 0 ||
        sigaction(SIGTERM, &action, &previousTerm) != 0) {
        int err = errno;
        sigaction(SIGINT, &previousInt, nullptr);
        g_signalWriteFd = -1;
        closePipes();
        g_listenerActive = false;
        throw std::runtime_error(std::string("failed to install signal handlers: ") + std::strerror(err));
    }

    listenerThread = std::thread(&InterruptListener::listen, this);
}

InterruptListener::~InterruptListener() {
    sigaction(SIGINT, &previousInt, nullptr);
    sigaction(SIGTERM, &previousTerm, nullptr);
    g_signalWriteFd = -1;

    const char stop = 1;
    ssize_t ignored = write(stopPipe[1], &stop, 1);
    (void)ignored;
    if (listenerThread.joinable()) {
        listenerThread.join();
    }

    closePipes();
    g_listenerActive = false;
}

void InterruptListener::listen() {
    pollfd fds[2] = {
        {g_signalPipe[0], POLLIN, 0},
        {stopPipe[0], POLLIN, 0}
    };

    while (true) {
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            logger.error(std::string("interrupt listener poll failed: ") + std::strerror(errno));
            return;
        }
        if (fds[1].revents != 0) {
            return;
        }
        if (fds[0].revents & POLLIN) {
            unsigned char signo = 0;
            if (read(g_signalPipe[0], &signo, 1) == 1) {
                lastSignal = signo;
                logger.info("received signal " + std::to_string(signo));
                token.cancel();
            }
        }
    }
}

void InterruptListener::closePipes() {
    for (int* fd : {&g_signalPipe[0], &g_signalPipe[1], &stopPipe[0], &stopPipe[1]}) {
        if (*fd >= 0) {
            close(*fd);
            *fd = -1;
        }
    }
}
