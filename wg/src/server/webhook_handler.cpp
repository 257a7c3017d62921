/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/webhook_handler.hpp"
#include "wg/internal/signature.hpp"
#include "wg/log.hpp"

#include <string>

namespace wg::internal {

static const char* kGreeting =
    "Urm, hi?\n"
    "How did you get here?\n"
    "This is an api for computers 'n' stuff, not for humans :P";

static wg::HttpResponse ok_json() {
    wg::HttpResponse r;
    r.body = R"({"status":"OK"})";
    return r;
}

WebhookHandler::WebhookHandler(const wg::ServerConfig& cfg, const ActionLauncher& launcher)
    : _cfg(cfg), _launcher(launcher)
{}

wg::HttpResponse WebhookHandler::error(int status, const char* status_text, const char* reason) const {
    wg::HttpResponse r;
    r.status      = status;
    r.status_text = status_text;
    if (_cfg.redact_errors) r.body = R"({"status":"ERROR"})";
    else r.body = std::string(R"({"status":"ERROR","reason":")") + reason + R"("})";
    return r;
}

wg::HttpResponse WebhookHandler::handle(const wg::HttpRequest& R, const std::string& peer_ip) const {
    if (R.path == "/") {
        if (R.method == "POST") return handle_webhook(R, peer_ip);
        if (R.method == "GET") {
            wg::HttpResponse r;
            r.content_type = "text/plain; charset=utf-8";
            r.body = kGreeting;
            return r;
        }
        return error(405, "Method Not Allowed", kReasonMethod);
    }
    if (R.path == "/health") {
        if (R.method == "GET") return ok_json();
        return error(405, "Method Not Allowed", kReasonMethod);
    }
    return error(404, "Not Found", kReasonNotFound);
}

wg::HttpResponse WebhookHandler::handle_webhook(const wg::HttpRequest& R,
                                                const std::string& peer_ip) const
{
    std::string claimed;
    if (!extract_signature(R, claimed)) {
        wg::log_line("[400] ip=" + peer_ip + " reason=MISSING_SIGNATURE_HEADER");
        return error(400, "Bad Request", kReasonMissingSignature);
    }

    // Missing configuration is a server-side failure.
    if (_cfg.action_path.empty()) {
        wg::log_line("[500] ip=" + peer_ip + " reason=CONFIG action path is not set (" +
                     kEnvScript + ")");
        return error(500, "Internal Server Error", kReasonInternal);
    }
    if (_cfg.webhook_secret.empty()) {
        wg::log_line("[500] ip=" + peer_ip + " reason=CONFIG webhook secret is not set (" +
                     kEnvSecret + ")");
        return error(500, "Internal Server Error", kReasonInternal);
    }

    const VerifyResult vr = verify_signature(_cfg.webhook_secret, R.body, claimed);
    if (!vr.ok) {
        wg::log_line("[401] ip=" + peer_ip + " reason=" + verify_error_name(vr.error) +
                     "/" + vr.reason);
        return error(401, "Unauthorized", kReasonUnauthorized);
    }

    std::string err;
    if (!_launcher.launch(_cfg.action_path, err)) {
        wg::log_line("[500] ip=" + peer_ip + " reason=ACTION_LAUNCH " + err);
        return error(500, "Internal Server Error", kReasonInternal);
    }

    wg::log_line("[200] ip=" + peer_ip + " webhook accepted, body=" +
                 std::to_string(R.body.size()) + "B");
    return ok_json();
}

} // namespace wg::internal
