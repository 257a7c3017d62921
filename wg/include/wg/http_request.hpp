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
#include <unordered_map>

namespace wg {

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // "/"
    std::string query;    // "a=1&b=2"
    std::string httpver;  // "HTTP/1.1"
    // Field names are lower-cased; the first occurrence of a repeated field wins.
    std::unordered_map<std::string, std::string> headers;
    std::string body;     // raw bytes, exactly as received
};

// Response produced by the handler; the transport adds framing headers.
struct HttpResponse {
    int         status = 200;
    std::string status_text = "OK";
    std::string content_type = "application/json";
    std::string body;
};

} // namespace wg
