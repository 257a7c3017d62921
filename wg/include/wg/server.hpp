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
#include <thread>
#include <atomic>
#include <cstdint>
#include "wg/server_config.hpp"

namespace wg {

namespace internal { struct ConnectionContext; }

// Webhook HTTP(S) server
class Server {
public:
    explicit Server(const ServerConfig& cfg);
    ~Server();

    // Blocking run: create socket, listen and accept until stop().
    void run();

    // Closes the listening socket; run() returns shortly after.
    void stop();

    // Port actually bound (differs from cfg.port when it was 0); 0 before listening.
    uint16_t port() const { return _bound_port.load(std::memory_order_acquire); }

private:
    ServerConfig _cfg;
    // Shared with detached connection threads so they may outlive the server.
    std::shared_ptr<internal::ConnectionContext> _ctx;
    std::atomic<bool> _stop{false};
    std::atomic<int>  _listen_fd{-1};
    std::atomic<uint16_t> _bound_port{0};
    std::thread _rl_gc_thread;

    void rl_gc_loop();
    void log_startup() const;
    int create_listen_socket();
};

} // namespace wg
