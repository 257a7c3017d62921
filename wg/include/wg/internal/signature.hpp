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
#include "wg/http_request.hpp"

namespace wg::internal {

// Header carrying the GitHub-style payload signature.
inline constexpr const char* kSignatureHeader = "X-Hub-Signature-256";
// Algorithm tag that prefixes the hex digest.
inline constexpr const char* kSignaturePrefix = "sha256=";
inline constexpr std::size_t kSignaturePrefixLen = 7;
inline constexpr std::size_t kDigestLen = 32;

/**
 * Why a claimed signature was rejected. Only ever logged: every kind maps
 * to the same 401 response so the caller cannot tell them apart.
 */
enum class VerifyError {
    None,
    MalformedSignatureEncoding, // not printable ASCII, too short, or wrong tag
    InvalidHexEncoding,         // odd length or non-hex digit after the tag
    DigestMismatch              // well-formed but not the expected MAC
};

struct VerifyResult {
    bool ok = false;
    VerifyError error = VerifyError::None;
    std::string reason;  // log detail, e.g. "BAD_HEX"
};

const char* verify_error_name(VerifyError e);

// Pull the claimed signature out of the request. False if the header is absent.
bool extract_signature(const wg::HttpRequest& R, std::string& out);

/**
 * Verify `claimed` ("sha256=<hex>") against HMAC-SHA256(secret, payload).
 * `payload` must be the raw body bytes. The digest comparison is constant
 * time (CRYPTO_memcmp). Stateless and safe to call concurrently.
 */
VerifyResult verify_signature(const std::string& secret,
                              const std::string& payload,
                              const std::string& claimed);

// HMAC-SHA256 via OpenSSL. out_bin receives 32 raw bytes.
bool hmac_sha256_bin(const std::string& key,
                     const std::string& msg,
                     std::string& out_bin);

// Lower-case hex HMAC-SHA256, empty on failure.
std::string hmac_sha256_hex(const std::string& key, const std::string& msg);

// "sha256=<hex>" header value for payload, empty on failure.
std::string make_signature_header(const std::string& secret, const std::string& payload);

} // namespace wg::internal
