/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/tls_ctx.hpp"
#include "wg/log.hpp"
#include <openssl/err.h>
#include <stdexcept>
#include <string>

namespace wg::internal {

void log_ssl_errors(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        wg::log_line(std::string("[TLS] error at ") + where + ": " + buf);
    }
}

TlsContext::TlsContext(const wg::ServerConfig& cfg) {
    _ctx = SSL_CTX_new(TLS_server_method());
    if (!_ctx) fail("SSL_CTX_new");

    // TLS1.2+
    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        fail("set_min_proto");
    }

    // certificates
    if (SSL_CTX_use_certificate_chain_file(_ctx, cfg.tls_cert_file.c_str()) != 1) {
        fail("use_certificate_chain_file");
    }
    if (SSL_CTX_use_PrivateKey_file(_ctx, cfg.tls_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        fail("use_privatekey_file");
    }
    if (SSL_CTX_check_private_key(_ctx) != 1) {
        fail("check_private_key");
    }

    if (!cfg.tls_client_ca.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_client_ca.c_str(), nullptr) != 1) {
            fail("load_verify_locations");
        }
        int vmode = SSL_VERIFY_PEER;
        if (cfg.require_client_cert) vmode |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
        SSL_CTX_set_verify(_ctx, vmode, nullptr);
    }

    // session cache
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_SERVER);
    const unsigned char sid_ctx[] = "wg_server_sid_ctx_v1";
    SSL_CTX_set_session_id_context(_ctx, sid_ctx, (unsigned int)sizeof(sid_ctx) - 1);
}

TlsContext::~TlsContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsContext::fail(const char* where) {
    log_ssl_errors(where);
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
    wg::log_line(std::string("[FATAL] TLS context setup failed at ") + where);
    throw std::runtime_error(std::string("TLS setup failed: ") + where);
}

} // namespace wg::internal
