//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_line_transport.cpp
// Purpose: StdioLineTransport framing over pipes: split reads, CRLF, oversized lines, EOF and Close()
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <future>
#include <string>
#include <thread>

#include "payload/StdioLineTransport.hpp"
#include "payload/errors/Errors.h"

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

using namespace payload;
using namespace std::chrono_literals;

namespace {

// Owns both ends of a pipe.
struct Pipe {
    int fds[2]{-1, -1};
    Pipe() {
        if (::pipe(fds) != 0) {
            throw std::runtime_error("pipe() failed");
        }
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    int readFd() const { return fds[0]; }
    int writeFd() const { return fds[1]; }
    void closeRead() {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void closeWrite() {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
    void write(const std::string& s) const {
        std::size_t off = 0;
        while (off < s.size()) {
            ssize_t w = ::write(fds[1], s.data() + off, s.size() - off);
            if (w < 0 && errno == EINTR) continue;
            if (w <= 0) throw std::runtime_error("pipe write failed");
            off += static_cast<std::size_t>(w);
        }
    }
    std::string readAvailable() const {
        std::string out;
        char buf[4096];
        int flags = ::fcntl(fds[0], F_GETFL, 0);
        ::fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);
        for (;;) {
            ssize_t n = ::read(fds[0], buf, sizeof(buf));
            if (n <= 0) break;
            out.append(buf, static_cast<std::size_t>(n));
        }
        ::fcntl(fds[0], F_SETFL, flags);
        return out;
    }
};

} // namespace

TEST(StdioLineTransport, ReadsLinesAcrossSplitWrites) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readFd(), out.writeFd());

    auto reader = std::async(std::launch::async, [&]() { return t.ReadLine(); });
    in.write(R"({"jsonrpc":"2.0",)");
    std::this_thread::sleep_for(20ms);
    in.write("\"id\":1}\n{\"second\":true}\n");

    ASSERT_EQ(reader.wait_for(2s), std::future_status::ready);
    auto first = reader.get();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->text, R"({"jsonrpc":"2.0","id":1})");
    EXPECT_FALSE(first->Oversized());

    auto second = t.ReadLine();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->text, R"({"second":true})");
}

TEST(StdioLineTransport, StripsCarriageReturn) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readFd(), out.writeFd());
    in.write("{\"a\":1}\r\n");
    auto line = t.ReadLine();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->text, "{\"a\":1}");
}

TEST(StdioLineTransport, EmptyLineIsDelivered) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readFd(), out.writeFd());
    in.write("\nnext\n");
    auto empty = t.ReadLine();
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->text.empty());
    EXPECT_FALSE(empty->Oversized());
    auto next = t.ReadLine();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->text, "next");
}

TEST(StdioLineTransport, FinalLineWithoutTerminatorThenEof) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readFd(), out.writeFd());
    in.write("one\ntwo");
    in.closeWrite();

    auto a = t.ReadLine();
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->text, "one");
    auto b = t.ReadLine();
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->text, "two");
    EXPECT_FALSE(t.ReadLine().has_value());
    EXPECT_FALSE(t.ReadLine().has_value());
}

TEST(StdioLineTransport, OverlongLineIsDiscardedAndFollowingLineSurvives) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readFd(), out.writeFd(), 64);

    auto writer = std::async(std::launch::async, [&]() {
        in.write(std::string(10000, 'x') + "\n" + "{\"ok\":1}\n");
        in.closeWrite();
    });

    auto big = t.ReadLine();
    ASSERT_TRUE(big.has_value());
    EXPECT_TRUE(big->Oversized());
    EXPECT_EQ(big->discardedBytes, 10000u);
    EXPECT_TRUE(big->text.empty());

    auto ok = t.ReadLine();
    ASSERT_TRUE(ok.has_value());
    EXPECT_FALSE(ok->Oversized());
    EXPECT_EQ(ok->text, "{\"ok\":1}");

    EXPECT_FALSE(t.ReadLine().has_value());
    writer.get();
}

TEST(StdioLineTransport, LineAtExactLimitIsKept) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readFd(), out.writeFd(), 8);
    in.write("12345678\n123456789\n");
    auto exact = t.ReadLine();
    ASSERT_TRUE(exact.has_value());
    EXPECT_FALSE(exact->Oversized());
    EXPECT_EQ(exact->text, "12345678");
    auto over = t.ReadLine();
    ASSERT_TRUE(over.has_value());
    EXPECT_TRUE(over->Oversized());
}

TEST(StdioLineTransport, CloseUnblocksPendingRead) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readFd(), out.writeFd());
    auto reader = std::async(std::launch::async, [&]() { return t.ReadLine(); });
    EXPECT_EQ(reader.wait_for(100ms), std::future_status::timeout);
    t.Close();
    ASSERT_EQ(reader.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(reader.get().has_value());
    t.Close();
}

TEST(StdioLineTransport, WriteLineWritesWholeLine) {
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readFd(), out.writeFd());
    t.WriteLine("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":null}\n");
    t.WriteLine("{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":null}\n");
    EXPECT_EQ(out.readAvailable(),
              "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":null}\n{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":null}\n");
}

TEST(StdioLineTransport, WriteToClosedPipeThrows) {
    // EPIPE instead of process termination
    auto previous = std::signal(SIGPIPE, SIG_IGN);
    Pipe in;
    Pipe out;
    StdioLineTransport t(in.readFd(), out.writeFd());
    out.closeRead();
    EXPECT_THROW(t.WriteLine("x\n"), errors::TransportError);
    std::signal(SIGPIPE, previous);
}

TEST(StdioLineTransport, RegularFileInputUsesBlockingReads) {
    char path[] = "/tmp/payload_stdio_XXXXXX";
    int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    const std::string body = "{\"a\":1}\n{\"b\":2}";
    ASSERT_EQ(::write(fd, body.data(), body.size()), static_cast<ssize_t>(body.size()));
    ::lseek(fd, 0, SEEK_SET);

    Pipe out;
    {
        StdioLineTransport t(fd, out.writeFd());
        auto a = t.ReadLine();
        ASSERT_TRUE(a.has_value());
        EXPECT_EQ(a->text, "{\"a\":1}");
        auto b = t.ReadLine();
        ASSERT_TRUE(b.has_value());
        EXPECT_EQ(b->text, "{\"b\":2}");
        EXPECT_FALSE(t.ReadLine().has_value());
    }
    ::close(fd);
    ::unlink(path);
}
