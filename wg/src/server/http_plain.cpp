/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/connection.hpp"

#include <cerrno>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace wg::internal {

namespace {

constexpr std::size_t kMaxDrainBytes = 1024 * 1024;

class FdStream : public Stream {
public:
    explicit FdStream(int fd) : _fd(fd) {}

    long read_some(char* buf, std::size_t n) override {
        ssize_t r;
        do {
            r = ::recv(_fd, buf, n, 0);
        } while (r < 0 && errno == EINTR);
        return static_cast<long>(r);
    }

    bool write_all(const char* d, std::size_t len) override {
        std::size_t off = 0;
        while (off < len) {
            ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            off += static_cast<std::size_t>(n);
        }
        return true;
    }

private:
    int _fd;
};

} // namespace

void handle_connection_plain(int fd, ConnectionContext& ctx, const std::string& peer_ip) {
    // Per-connection kernel timeouts
    timeval tv{ctx.cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    FdStream s(fd);
    serve_stream(s, ctx, peer_ip);

    lingering_close(fd);
}

void lingering_close(int fd) {
    ::shutdown(fd, SHUT_WR);

    timeval tv{1, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    char buf[4096];
    std::size_t drained = 0;
    while (drained < kMaxDrainBytes) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        drained += static_cast<std::size_t>(n);
    }
    ::close(fd);
}

} // namespace wg::internal
