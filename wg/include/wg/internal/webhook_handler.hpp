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
#include "wg/http_request.hpp"
#include "wg/server_config.hpp"
#include "wg/internal/action.hpp"

namespace wg::internal {

// Public error reasons; the only failure detail a client ever sees.
inline constexpr const char* kReasonBadRequest       = "BAD_REQUEST";
inline constexpr const char* kReasonMissingSignature = "MISSING_SIGNATURE";
inline constexpr const char* kReasonUnauthorized     = "UNAUTHORIZED";
inline constexpr const char* kReasonInternal         = "INTERNAL_ERROR";
inline constexpr const char* kReasonNotFound         = "NOT_FOUND";
inline constexpr const char* kReasonMethod           = "METHOD_NOT_ALLOWED";
inline constexpr const char* kReasonTooLarge         = "PAYLOAD_TOO_LARGE";
inline constexpr const char* kReasonRateLimit        = "RATE_LIMIT";

// Routes one parsed request and runs the webhook flow:
// signature header -> configuration -> verify -> launch action.
class WebhookHandler {
public:
    WebhookHandler(const wg::ServerConfig& cfg, const ActionLauncher& launcher);

    wg::HttpResponse handle(const wg::HttpRequest& R, const std::string& peer_ip) const;

    // JSON error response; the reason is dropped when redact_errors is set.
    wg::HttpResponse error(int status, const char* status_text, const char* reason) const;

private:
    const wg::ServerConfig& _cfg;
    const ActionLauncher&   _launcher;

    wg::HttpResponse handle_webhook(const wg::HttpRequest& R, const std::string& peer_ip) const;
};

} // namespace wg::internal
