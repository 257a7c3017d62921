/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/connection.hpp"
#include "wg/internal/tls_ctx.hpp"
#include "wg/log.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <climits>
#include <algorithm>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace wg::internal {

namespace {

class SslStream : public Stream {
public:
    explicit SslStream(SSL* ssl) : _ssl(ssl) {}

    long read_some(char* buf, std::size_t n) override {
        int r = SSL_read(_ssl, buf, static_cast<int>(std::min<std::size_t>(n, INT_MAX)));
        if (r <= 0) {
            (void)SSL_get_error(_ssl, r);
            ERR_clear_error();
        }
        return r;
    }

    bool write_all(const char* d, std::size_t len) override {
        std::size_t off = 0;
        while (off < len) {
            const int chunk = static_cast<int>(std::min<std::size_t>(len - off, INT_MAX));
            int n = SSL_write(_ssl, d + off, chunk);
            if (n <= 0) {
                (void)SSL_get_error(_ssl, n);
                ERR_clear_error();
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    }

private:
    SSL* _ssl;
};

} // namespace

void handle_connection_tls(int fd, ConnectionContext& ctx, const std::string& peer_ip) {
    // Timeouts first so a stalled handshake cannot pin the thread.
    timeval tv{ctx.cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    SSL* ssl = SSL_new(ctx.tls->ctx());
    if (!ssl) {
        log_ssl_errors("SSL_new");
        ::close(fd);
        return;
    }
    SSL_set_fd(ssl, fd);

    if (SSL_accept(ssl) <= 0) {
        wg::log_line("[TLS] handshake failed ip=" + peer_ip);
        log_ssl_errors("SSL_accept");
        SSL_free(ssl);
        ::close(fd);
        return;
    }

    SslStream s(ssl);
    serve_stream(s, ctx, peer_ip);

    SSL_shutdown(ssl);
    SSL_free(ssl);
    lingering_close(fd);
}

} // namespace wg::internal
