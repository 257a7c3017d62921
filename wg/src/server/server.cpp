/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/server.hpp"
#include "wg/internal/connection.hpp"
#include "wg/log.hpp"

#include <stdexcept>
#include <string>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <csignal>
#include <chrono>
#include <system_error>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace wg {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg)
    : _cfg(cfg),
      _ctx(std::make_shared<internal::ConnectionContext>(cfg))
{
    // Idle buckets are only worth collecting when limiting is on.
    if (_cfg.rl_ip_rate > 0.0 && _cfg.rl_ip_burst > 0.0) {
        _rl_gc_thread = std::thread(&Server::rl_gc_loop, this);
    }
}

Server::~Server() {
    stop();
    if (_rl_gc_thread.joinable()) {
        _rl_gc_thread.join();
    }
}

void Server::stop() {
    _stop.store(true, std::memory_order_relaxed);
    int fd = _listen_fd.exchange(-1);
    if (fd >= 0) {
        // shutdown() wakes a thread blocked in accept()
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

void Server::rl_gc_loop() {
    using namespace std::chrono;
    auto last = steady_clock::now();
    while (!_stop.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(milliseconds(200));
        if (steady_clock::now() - last < seconds(60)) continue;
        last = steady_clock::now();
        _ctx->ip_rl.gc(seconds(300));
    }
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (srv < 0) {
        wg::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_cfg.port);
    if (inet_pton(AF_INET, _cfg.bind_addr.c_str(), &addr.sin_addr) != 1) {
        wg::log_line("[FATAL] invalid bind address: " + _cfg.bind_addr);
        ::close(srv);
        throw std::runtime_error("invalid bind address: " + _cfg.bind_addr);
    }

    if (bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        wg::log_line(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    if (listen(srv, 512) < 0) {
        wg::log_line(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }

    sockaddr_in bound{};
    socklen_t bl = sizeof(bound);
    if (getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &bl) == 0) {
        _bound_port.store(ntohs(bound.sin_port), std::memory_order_release);
    } else {
        _bound_port.store(_cfg.port, std::memory_order_release);
    }
    return srv;
}

void Server::log_startup() const {
    wg::log_line("[INFO] WebhookGate server starting...");
    wg::log_line("[INFO] Transport: " + std::string(_cfg.tls_enabled() ? "HTTPS" : "HTTP"));
    wg::log_line("[INFO] Body limit: " + std::to_string(_cfg.max_body) + " bytes");
    if (_cfg.action_path.empty()) {
        wg::log_line(std::string("[WARN] action path is not set (") + kEnvScript +
                     "); webhook requests will fail with 500");
    } else {
        wg::log_line("[INFO] Action: " +
                     (_cfg.action_shell.empty() ? std::string() : _cfg.action_shell + " ") +
                     _cfg.action_path);
    }
    if (_cfg.webhook_secret.empty()) {
        wg::log_line(std::string("[WARN] webhook secret is not set (") + kEnvSecret +
                     "); webhook requests will fail with 500");
    }
    if (_cfg.redact_errors) {
        wg::log_line("[INFO] Error redaction: ENABLED");
    }
    if (_cfg.rl_ip_rate > 0.0 && _cfg.rl_ip_burst > 0.0) {
        wg::log_line("[INFO] RL-IP: rate=" + std::to_string(_cfg.rl_ip_rate) +
                     " burst=" + std::to_string(_cfg.rl_ip_burst));
    }
    wg::log_line("[INFO] KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                 "s, KA max=" + std::to_string(_cfg.ka_max));
}

void Server::run() {
    log_startup();

    // OpenSSL's socket BIO writes without MSG_NOSIGNAL; a peer reset during
    // a TLS write or SSL_shutdown must fail that write, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    int srv = create_listen_socket();
    int expected = -1;
    if (_stop.load(std::memory_order_relaxed) || !_listen_fd.compare_exchange_strong(expected, srv)) {
        ::close(srv);
        return;
    }
    wg::log_line(std::string("[INFO] Listening ") + (_cfg.tls_enabled() ? "HTTPS" : "HTTP") +
                 " on " + _cfg.bind_addr + ":" + std::to_string(port()));

    const bool tls = _cfg.tls_enabled();
    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept4(srv, reinterpret_cast<sockaddr*>(&cli), &cl, SOCK_CLOEXEC);
        if (fd < 0) {
            if (_stop.load(std::memory_order_relaxed)) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            // fd exhaustion and friends; back off instead of spinning
            wg::log_line(std::string("[WARN] accept() failed: ") + std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        // Detach a per-connection handler; it owns fd and keeps ctx alive.
        try {
            std::thread([ctx = _ctx, fd, peer, tls]() {
                if (tls) internal::handle_connection_tls(fd, *ctx, peer);
                else     internal::handle_connection_plain(fd, *ctx, peer);
            }).detach();
        } catch (const std::system_error& e) {
            wg::log_line(std::string("[WARN] cannot start connection thread: ") + e.what());
            ::close(fd);
        }
    }

    stop();
    wg::log_line("[INFO] Server stopped");
}

} // namespace wg
