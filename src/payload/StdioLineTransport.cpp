//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioLineTransport.cpp
// Purpose: epoll/eventfd line reader and write-all line writer over file descriptors
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <cstring>

#include <array>
#include <atomic>
#include <mutex>
#include <string>

#include "logging/Logger.h"
#include "payload/StdioLineTransport.hpp"
#include "payload/errors/Errors.h"

namespace payload {

class StdioLineTransport::Impl {
public:
    int inFd;
    int outFd;
    std::size_t maxLineBytes;
    int epollFd{-1};
    int wakeEventFd{-1};
    bool pollable{false};
    std::atomic<bool> closed{false};
    bool eof{false};
    std::mutex writeMutex;

    std::string buffer;
    std::size_t scanFrom{0};
    bool discarding{false};
    std::size_t discarded{0};

    Impl(int in, int out, std::size_t maxBytes) : inFd(in), outFd(out), maxLineBytes(maxBytes) {
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioLineTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
        epollFd = ::epoll_create1(EPOLL_CLOEXEC);
        if (epollFd < 0) {
            LOG_ERROR("StdioLineTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
            return;
        }
        epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = inFd;
        if (::epoll_ctl(epollFd, EPOLL_CTL_ADD, inFd, &evIn) == 0) {
            pollable = true;
        } else if (errno == EPERM) {
            LOG_DEBUG("StdioLineTransport: fd {} not pollable; using blocking reads", inFd);
        } else {
            LOG_WARN("StdioLineTransport: epoll_ctl(in) failed (errno={} msg={})", errno, ::strerror(errno));
        }
        if (pollable && wakeEventFd >= 0) {
            epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
            if (::epoll_ctl(epollFd, EPOLL_CTL_ADD, wakeEventFd, &evWake) != 0) {
                LOG_WARN("StdioLineTransport: epoll_ctl(wake) failed (errno={} msg={})", errno, ::strerror(errno));
            }
        }
    }

    ~Impl() {
        if (epollFd >= 0) {
            ::close(epollFd);
        }
        if (wakeEventFd >= 0) {
            ::close(wakeEventFd);
        }
    }

    void stripCarriageReturn(std::string& s) {
        if (!s.empty() && s.back() == '\r') {
            s.pop_back();
        }
    }

    // Extracts one complete line from the buffer when present.
    std::optional<InboundLine> takeLine() {
        std::size_t nl = buffer.find('\n', scanFrom);
        if (nl == std::string::npos) {
            scanFrom = buffer.size();
            if (buffer.size() > maxLineBytes) {
                // Keep counting but stop holding the bytes
                discarded += buffer.size();
                buffer.clear();
                scanFrom = 0;
                discarding = true;
            }
            return std::nullopt;
        }
        InboundLine out;
        if (discarding || nl > maxLineBytes) {
            out.discardedBytes = discarded + nl;
            discarding = false;
            discarded = 0;
        } else {
            out.text = buffer.substr(0, nl);
            stripCarriageReturn(out.text);
        }
        buffer.erase(0, nl + 1);
        scanFrom = 0;
        return out;
    }

    // Whatever is left at end of stream forms the last line.
    std::optional<InboundLine> takeRemainder() {
        eof = true;
        if (discarding) {
            InboundLine out;
            out.discardedBytes = discarded + buffer.size();
            discarding = false;
            discarded = 0;
            buffer.clear();
            return out;
        }
        if (buffer.empty()) {
            return std::nullopt;
        }
        InboundLine out;
        if (buffer.size() > maxLineBytes) {
            out.discardedBytes = buffer.size();
        } else {
            out.text = std::move(buffer);
            stripCarriageReturn(out.text);
        }
        buffer.clear();
        scanFrom = 0;
        return out;
    }

    // Waits until inFd is readable. Returns false when woken by Close().
    bool waitReadable() {
        std::array<epoll_event, 2> events{};
        for (;;) {
            int rc = ::epoll_wait(epollFd, events.data(), static_cast<int>(events.size()), -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw errors::TransportError(std::string("StdioLineTransport: epoll_wait failed: ") + ::strerror(errno));
            }
            bool readable = false;
            for (int i = 0; i < rc; ++i) {
                if (events[static_cast<std::size_t>(i)].data.fd == wakeEventFd) {
                    uint64_t v = 0;
                    ssize_t r;
                    do {
                        r = ::read(wakeEventFd, &v, sizeof(v));
                    } while (r < 0 && errno == EINTR);
                    if (r < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                        LOG_WARN("StdioLineTransport: wake event read failed (errno={} msg={})", errno, ::strerror(errno));
                    }
                } else {
                    // EPOLLHUP may arrive with data still buffered; read() reports the actual EOF
                    readable = true;
                }
            }
            if (closed.load()) {
                return false;
            }
            if (readable) {
                return true;
            }
        }
    }
};

StdioLineTransport::StdioLineTransport(int inFd, int outFd, std::size_t maxLineBytes)
    : pImpl(std::make_unique<Impl>(inFd, outFd, maxLineBytes)) {
    FUNC_SCOPE();
}

StdioLineTransport::~StdioLineTransport() {
    FUNC_SCOPE();
}

std::optional<InboundLine> StdioLineTransport::ReadLine() {
    FUNC_SCOPE();
    std::array<char, 4096> tmp{};
    while (true) {
        if (pImpl->closed.load()) {
            return std::nullopt;
        }
        if (auto line = pImpl->takeLine()) {
            return line;
        }
        if (pImpl->eof) {
            return std::nullopt;
        }
        if (pImpl->pollable && !pImpl->waitReadable()) {
            LOG_DEBUG("StdioLineTransport: read interrupted by Close()");
            return std::nullopt;
        }
        ssize_t n = ::read(pImpl->inFd, tmp.data(), tmp.size());
        if (n > 0) {
            pImpl->buffer.append(tmp.data(), static_cast<std::size_t>(n));
        } else if (n == 0) {
            LOG_DEBUG("StdioLineTransport: EOF on fd {}", pImpl->inFd);
            return pImpl->takeRemainder();
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            throw errors::TransportError(std::string("StdioLineTransport: read error: ") + ::strerror(errno));
        }
    }
}

void StdioLineTransport::WriteLine(const std::string& line) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    std::size_t total = 0;
    while (total < line.size()) {
        ssize_t w = ::write(pImpl->outFd, line.data() + total, line.size() - total);
        if (w > 0) {
            total += static_cast<std::size_t>(w);
        } else if (w < 0 && errno == EINTR) {
            continue;
        } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Non-blocking descriptor is full; wait for room
            struct pollfd pfd{};
            pfd.fd = pImpl->outFd;
            pfd.events = POLLOUT;
            if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) {
                throw errors::TransportError(std::string("StdioLineTransport: poll(out) failed: ") + ::strerror(errno));
            }
        } else {
            const int err = (w < 0) ? errno : EIO;
            throw errors::TransportError(std::string("StdioLineTransport: write error: ") + ::strerror(err));
        }
    }
}

void StdioLineTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->closed.exchange(true)) {
        return;
    }
    if (pImpl->wakeEventFd < 0) {
        return;
    }
    uint64_t one = 1;
    for (;;) {
        ssize_t w = ::write(pImpl->wakeEventFd, &one, sizeof(one));
        if (w >= 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioLineTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
        break;
    }
}

} // namespace payload
