//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SignalWatcher.cpp
// Purpose: Termination signal handling via async-signal-safe eventfd wake and a watcher thread
//==========================================================================================================

#include <unistd.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <cstring>

#include <atomic>
#include <string>
#include <system_error>
#include <thread>

#include "logging/Logger.h"
#include "payload/SignalWatcher.hpp"

namespace payload {

namespace {
std::atomic<int> gWakeFd{-1};
std::atomic<int> gPendingSignal{0};

void onTerminationSignal(int signo) {
    const int savedErrno = errno;
    int expected = 0;
    gPendingSignal.compare_exchange_strong(expected, signo);
    const int fd = gWakeFd.load();
    if (fd >= 0) {
        uint64_t one = 1;
        // Nothing useful can be done about a failed write in signal context
        ssize_t w = ::write(fd, &one, sizeof(one));
        (void)w;
    }
    errno = savedErrno;
}
} // namespace

class SignalWatcher::Impl {
public:
    Callback callback;
    int wakeFd{-1};
    std::atomic<bool> stopping{false};
    bool started{false};
    std::thread watcherThread;
    struct sigaction previousTerm{};
    struct sigaction previousInt{};

    void run() {
        while (true) {
            struct pollfd pfd{};
            pfd.fd = wakeFd;
            pfd.events = POLLIN;
            int rc = ::poll(&pfd, 1, -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("SignalWatcher: poll failed (errno={} msg={})", errno, ::strerror(errno));
                return;
            }
            uint64_t v = 0;
            ssize_t r;
            do {
                r = ::read(wakeFd, &v, sizeof(v));
            } while (r < 0 && errno == EINTR);
            const int signo = gPendingSignal.load();
            if (signo != 0) {
                LOG_DEBUG("SignalWatcher: dispatching {}", SignalWatcher::SignalName(signo));
                if (callback) {
                    callback(signo);
                }
                return;
            }
            if (stopping.load()) {
                return;
            }
        }
    }
};

SignalWatcher::SignalWatcher(Callback callback) : pImpl(std::make_unique<Impl>()) {
    pImpl->callback = std::move(callback);
}

SignalWatcher::~SignalWatcher() {
    Stop();
}

void SignalWatcher::Start() {
    FUNC_SCOPE();
    if (pImpl->started) {
        return;
    }
    pImpl->wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (pImpl->wakeFd < 0) {
        throw std::system_error(errno, std::generic_category(), "SignalWatcher: eventfd");
    }
    int expected = -1;
    if (!gWakeFd.compare_exchange_strong(expected, pImpl->wakeFd)) {
        ::close(pImpl->wakeFd);
        pImpl->wakeFd = -1;
        throw std::system_error(std::make_error_code(std::errc::device_or_resource_busy),
                                "SignalWatcher: another watcher is active");
    }
    gPendingSignal.store(0);

    struct sigaction sa{};
    sa.sa_handler = onTerminationSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGTERM, &sa, &pImpl->previousTerm) != 0 ||
        ::sigaction(SIGINT, &sa, &pImpl->previousInt) != 0) {
        const int err = errno;
        gWakeFd.store(-1);
        ::close(pImpl->wakeFd);
        pImpl->wakeFd = -1;
        throw std::system_error(err, std::generic_category(), "SignalWatcher: sigaction");
    }

    pImpl->stopping = false;
    try {
        pImpl->watcherThread = std::thread([this]() { pImpl->run(); });
    } catch (const std::system_error&) {
        ::sigaction(SIGTERM, &pImpl->previousTerm, nullptr);
        ::sigaction(SIGINT, &pImpl->previousInt, nullptr);
        gWakeFd.store(-1);
        ::close(pImpl->wakeFd);
        pImpl->wakeFd = -1;
        throw;
    }
    pImpl->started = true;
    LOG_DEBUG("SignalWatcher: watching SIGTERM and SIGINT");
}

void SignalWatcher::Stop() {
    if (!pImpl || !pImpl->started) {
        return;
    }
    if (::sigaction(SIGTERM, &pImpl->previousTerm, nullptr) != 0 ||
        ::sigaction(SIGINT, &pImpl->previousInt, nullptr) != 0) {
        LOG_WARN("SignalWatcher: failed to restore signal dispositions (errno={} msg={})", errno, ::strerror(errno));
    }
    pImpl->stopping = true;
    uint64_t one = 1;
    ssize_t w;
    do {
        w = ::write(pImpl->wakeFd, &one, sizeof(one));
    } while (w < 0 && errno == EINTR);
    if (pImpl->watcherThread.joinable()) {
        if (pImpl->watcherThread.get_id() == std::this_thread::get_id()) {
            // Stopped from inside the callback
            pImpl->watcherThread.detach();
        } else {
            pImpl->watcherThread.join();
        }
    }
    gWakeFd.store(-1);
    ::close(pImpl->wakeFd);
    pImpl->wakeFd = -1;
    pImpl->started = false;
}

std::string SignalWatcher::SignalName(int signo) {
    switch (signo) {
        case SIGTERM: return "SIGTERM";
        case SIGINT: return "SIGINT";
        default: return "signal " + std::to_string(signo);
    }
}

} // namespace payload
