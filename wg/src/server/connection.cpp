/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/connection.hpp"
#include "wg/internal/http_parser.hpp"
#include "wg/internal/utils.hpp"
#include "wg/log.hpp"

#include <algorithm>
#include <sstream>

namespace wg::internal {

ConnectionContext::ConnectionContext(const wg::ServerConfig& c)
    : cfg(c),
      launcher(c.action_shell),
      handler(cfg, launcher)
{
    if (cfg.tls_enabled()) {
        tls = std::make_unique<TlsContext>(cfg);
    }
}

// --- HTTP/1.1 keep-alive helpers ---

static bool is_http11(const std::string& ver) {
    return ver == "HTTP/1.1";
}

bool should_keep_alive(const wg::HttpRequest& R) {
    std::string conn = lower_copy(hdr_ci(R, "Connection"));
    if (is_http11(R.httpver)) {
        return (conn != "close");
    } else {
        return (conn == "keep-alive");
    }
}

// --- Request reader ---

RecvStatus recv_http_request(Stream& s, const wg::ServerConfig& cfg, wg::HttpRequest& R) {
    // Bytes left over from the previous request on this connection.
    std::string req;
    req.swap(s.carry);
    char buf[4096];

    std::size_t hdr_end = req.find("\r\n\r\n");
    while (hdr_end == std::string::npos) {
        if (req.size() > kMaxHeaderBytes) return RecvStatus::Malformed;
        long n = s.read_some(buf, sizeof(buf));
        if (n <= 0) return RecvStatus::Closed;
        req.append(buf, buf + n);
        hdr_end = req.find("\r\n\r\n");
    }
    if (hdr_end > kMaxHeaderBytes) return RecvStatus::Malformed;

    if (!parse_request_head(req.substr(0, hdr_end), R)) return RecvStatus::Malformed;

    // Chunked bodies are not supported; a webhook sender always knows its length.
    std::string te;
    if (find_header(R, "Transfer-Encoding", te)) return RecvStatus::Malformed;

    std::size_t content_len = 0;
    std::string cl;
    if (find_header(R, "Content-Length", cl)) {
        if (!parse_content_length(cl, content_len)) return RecvStatus::Malformed;
        if (content_len > cfg.max_body) return RecvStatus::TooLarge;
    }

    const std::size_t body_start = hdr_end + 4;
    const std::size_t have = req.size() - body_start;
    R.body.assign(req, body_start, std::min(have, content_len));
    if (have > content_len) {
        s.carry.assign(req, body_start + content_len, std::string::npos);
    }
    while (R.body.size() < content_len) {
        long n = s.read_some(buf, sizeof(buf));
        if (n <= 0) return RecvStatus::Closed;
        const std::size_t got  = static_cast<std::size_t>(n);
        const std::size_t need = content_len - R.body.size();
        R.body.append(buf, buf + std::min(got, need));
        if (got > need) s.carry.append(buf + need, buf + got);
    }
    return RecvStatus::Ok;
}

// --- Response writer ---

void send_http_response(Stream& s, const wg::ServerConfig& cfg,
                        const wg::HttpResponse& resp, bool keep_alive)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status << " " << resp.status_text << "\r\n";
    oss << "Content-Type: " << resp.content_type << "\r\n";
    oss << "Content-Length: " << resp.body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec
            << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    const std::string h = oss.str();
    if (!s.write_all(h.data(), h.size())) return;
    (void)s.write_all(resp.body.data(), resp.body.size());
}

// --- Keep-alive loop ---

void serve_stream(Stream& s, ConnectionContext& ctx, const std::string& peer_ip) {
    const wg::ServerConfig& cfg = ctx.cfg;

    int served = 0;
    while (served < cfg.ka_max) {
        wg::HttpRequest R;
        const RecvStatus st = recv_http_request(s, cfg, R);
        if (st == RecvStatus::Closed) break;
        if (st == RecvStatus::TooLarge) {
            wg::log_line("[413] ip=" + peer_ip + " reason=BODY_LIMIT max=" +
                         std::to_string(cfg.max_body));
            send_http_response(s, cfg, ctx.handler.error(413, "Payload Too Large", kReasonTooLarge), false);
            break;
        }
        if (st == RecvStatus::Malformed) {
            wg::log_line("[400] ip=" + peer_ip + " reason=MALFORMED_REQUEST");
            send_http_response(s, cfg, ctx.handler.error(400, "Bad Request", kReasonBadRequest), false);
            break;
        }

        ++served;
        const bool ka = should_keep_alive(R) && served < cfg.ka_max;

        if (!ctx.ip_rl.allow(peer_ip, cfg.rl_ip_rate, cfg.rl_ip_burst)) {
            wg::log_line("[429] ip=" + peer_ip + " reason=IP_RATE_LIMIT");
            send_http_response(s, cfg, ctx.handler.error(429, "Too Many Requests", kReasonRateLimit), ka);
        } else {
            send_http_response(s, cfg, ctx.handler.handle(R, peer_ip), ka);
        }
        if (!ka) break;
    }
}

} // namespace wg::internal
