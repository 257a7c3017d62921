/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/http_parser.hpp"
#include "wg/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace wg::internal {

bool parse_request_line(const std::string& line, wg::HttpRequest& r) {
    const std::size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) return false;
    const std::size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) return false;
    if (line.find(' ', sp2 + 1) != std::string::npos) return false;

    r.method  = line.substr(0, sp1);
    std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    r.httpver = line.substr(sp2 + 1);

    if (r.httpver.compare(0, 5, "HTTP/") != 0) return false;
    if (target.empty() || target[0] != '/') return false;

    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return true;
}

bool parse_request_head(const std::string& head, wg::HttpRequest& r) {
    std::size_t line_end = head.find("\r\n");
    const std::string first = head.substr(0, line_end);
    if (!parse_request_line(first, r)) return false;

    r.headers.clear();
    if (line_end == std::string::npos) return true;

    std::size_t pos = line_end + 2;
    while (pos < head.size()) {
        std::size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        if (line.empty()) continue;
        std::size_t c = line.find(':');
        if (c == std::string::npos || c == 0) return false;
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        trim_inplace(k);
        trim_inplace(v);
        if (k.empty()) return false;
        r.headers.emplace(lower_copy(std::move(k)), std::move(v));
    }
    return true;
}

bool find_header(const wg::HttpRequest& R, const char* name, std::string& out) {
    auto it = R.headers.find(lower_copy(name));
    if (it == R.headers.end()) return false;
    out = it->second;
    return true;
}

std::string hdr_ci(const wg::HttpRequest& R, const char* name) {
    std::string v;
    (void)find_header(R, name, v);
    return v;
}

bool parse_content_length(const std::string& s, std::size_t& out) {
    if (s.empty() || s.size() > 19) return false;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    unsigned long long v = std::stoull(s);
    if (v > std::numeric_limits<std::size_t>::max()) return false;
    out = static_cast<std::size_t>(v);
    return true;
}

} // namespace wg::internal
