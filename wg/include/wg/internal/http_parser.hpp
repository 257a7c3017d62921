/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <string>
#include "wg/http_request.hpp"

namespace wg::internal {

// Parse "POST /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, wg::HttpRequest& r);

// Parse the header block (request line + fields, without the final CRLFCRLF).
// Field names are lower-cased; repeated fields keep their first value.
bool parse_request_head(const std::string& head, wg::HttpRequest& r);

// Case-insensitive header lookup. Returns false when the field is absent.
bool find_header(const wg::HttpRequest& R, const char* name, std::string& out);

// Same, but an absent field reads as "".
std::string hdr_ci(const wg::HttpRequest& R, const char* name);

// Parse a Content-Length value (digits only).
bool parse_content_length(const std::string& s, std::size_t& out);

} // namespace wg::internal
