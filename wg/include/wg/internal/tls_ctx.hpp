/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include "wg/server_config.hpp"

namespace wg::internal {

// Lightweight RAII wrapper over SSL_CTX. Throws std::runtime_error when the
// certificate or key cannot be loaded.
class TlsContext {
public:
    explicit TlsContext(const wg::ServerConfig& cfg);
    ~TlsContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;

    [[noreturn]] void fail(const char* where);
};

// Drain the OpenSSL error queue into the log.
void log_ssl_errors(const char* where);

} // namespace wg::internal
