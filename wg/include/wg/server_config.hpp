/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace wg {

// Environment variable names
inline constexpr const char* kEnvSecret  = "WEBHOOK_SECRET";
inline constexpr const char* kEnvScript  = "WEBHOOK_SCRIPT";
inline constexpr const char* kEnvShell   = "WEBHOOK_SHELL";
inline constexpr const char* kEnvAddress = "WEBHOOK_ADDRESS";
inline constexpr const char* kEnvPort    = "WEBHOOK_PORT";
inline constexpr const char* kEnvMaxBody = "WEBHOOK_MAX_BODY";

// Upper bound accepted for max_body (1 GiB).
inline constexpr unsigned long kMaxBodyLimit = 1ul << 30;

struct ServerConfig {
    // Listener
    std::string bind_addr = "0.0.0.0";
    uint16_t    port = 8080;      // 0 = pick an ephemeral port

    // Webhook. Empty secret or action path means "not configured"; the
    // server still starts and answers webhook requests with 500.
    std::string webhook_secret;
    std::string action_path;
    std::string action_shell = "bash";  // empty = exec action_path directly

    // Request limits
    size_t max_body = 32 * 1024;

    // TLS (enabled when both cert and key are set)
    std::string tls_cert_file;
    std::string tls_key_file;
    std::string tls_client_ca;
    bool        require_client_cert = false;

    // Error redaction
    bool redact_errors = false;

    // Per-IP rate limit (disabled when rate or burst is 0)
    double rl_ip_rate  = 0.0;
    double rl_ip_burst = 0.0;

    // Keep-alive
    int  ka_timeout_sec = 5;
    int  ka_max         = 100;

    // Logging (stdout only when empty)
    std::string log_file;

    bool tls_enabled() const { return !tls_cert_file.empty() && !tls_key_file.empty(); }
    bool webhook_configured() const { return !webhook_secret.empty() && !action_path.empty(); }
};

// Parse a decimal setting in [0, max]. Signs, blanks and trailing junk are
// rejected. Throws std::invalid_argument naming the setting.
unsigned long parse_unsigned(const char* name, const std::string& s, unsigned long max);

// Apply WEBHOOK_* environment variables on top of cfg.
// Throws std::invalid_argument on malformed numeric values.
void load_env(ServerConfig& cfg);

} // namespace wg
