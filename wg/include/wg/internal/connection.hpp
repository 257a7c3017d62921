/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <string>
#include <cstddef>
#include "wg/http_request.hpp"
#include "wg/server_config.hpp"
#include "wg/internal/action.hpp"
#include "wg/internal/ratelimit.hpp"
#include "wg/internal/tls_ctx.hpp"
#include "wg/internal/webhook_handler.hpp"

namespace wg::internal {

// Everything a connection thread needs. Owned through shared_ptr by the
// server and by every live connection.
struct ConnectionContext {
    explicit ConnectionContext(const wg::ServerConfig& c);

    const wg::ServerConfig      cfg;
    const ActionLauncher        launcher;
    const WebhookHandler        handler;
    TokenBucketMap              ip_rl;
    std::unique_ptr<TlsContext> tls;   // only when cfg.tls_enabled()
};

// Byte stream over a plain socket or a TLS session.
class Stream {
public:
    virtual ~Stream() = default;
    // Bytes read, or <= 0 on EOF / error / timeout.
    virtual long read_some(char* buf, std::size_t n) = 0;
    virtual bool write_all(const char* d, std::size_t n) = 0;

    // Bytes read past the end of the previous request (pipelining).
    std::string carry;
};

enum class RecvStatus { Ok, Closed, Malformed, TooLarge };

// Header block cap.
inline constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

// Read one request. Bodies above cfg.max_body are refused before reading.
RecvStatus recv_http_request(Stream& s, const wg::ServerConfig& cfg, wg::HttpRequest& R);

void send_http_response(Stream& s, const wg::ServerConfig& cfg,
                        const wg::HttpResponse& resp, bool keep_alive);

bool should_keep_alive(const wg::HttpRequest& R);

// Keep-alive request loop shared by the plain and TLS transports.
void serve_stream(Stream& s, ConnectionContext& ctx, const std::string& peer_ip);

// Half-close, drain what the peer still sends (bounded), then close. Closing
// with unread input would reset the connection and could drop our response.
void lingering_close(int fd);

// Per-transport entry points; each one owns and closes fd.
void handle_connection_plain(int fd, ConnectionContext& ctx, const std::string& peer_ip);
void handle_connection_tls(int fd, ConnectionContext& ctx, const std::string& peer_ip);

} // namespace wg::internal
