/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include "wg/internal/signature.hpp"
#include "wg/internal/http_parser.hpp"
#include "wg/internal/utils.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>

namespace wg::internal {

const char* verify_error_name(VerifyError e) {
    switch (e) {
    case VerifyError::None:                       return "None";
    case VerifyError::MalformedSignatureEncoding: return "MalformedSignatureEncoding";
    case VerifyError::InvalidHexEncoding:         return "InvalidHexEncoding";
    case VerifyError::DigestMismatch:             return "DigestMismatch";
    }
    return "Unknown";
}

bool extract_signature(const wg::HttpRequest& R, std::string& out) {
    return find_header(R, kSignatureHeader, out);
}

bool hmac_sha256_bin(const std::string& key,
                     const std::string& msg,
                     std::string& out_bin)
{
    unsigned int mac_len = 0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned char* p = HMAC(EVP_sha256(),
                            key.data(), (int)key.size(),
                            reinterpret_cast<const unsigned char*>(msg.data()),
                            msg.size(),
                            mac, &mac_len);
    if (!p || mac_len != kDigestLen) return false;
    out_bin.assign(reinterpret_cast<const char*>(mac), kDigestLen);
    OPENSSL_cleanse(mac, sizeof(mac));
    return true;
}

std::string hmac_sha256_hex(const std::string& key, const std::string& msg) {
    std::string bin;
    if (!hmac_sha256_bin(key, msg, bin)) return {};
    return bytes_to_hex(reinterpret_cast<const unsigned char*>(bin.data()), bin.size());
}

std::string make_signature_header(const std::string& secret, const std::string& payload) {
    std::string hex = hmac_sha256_hex(secret, payload);
    if (hex.empty()) return {};
    return kSignaturePrefix + hex;
}

static VerifyResult fail(VerifyError e, const char* reason) {
    VerifyResult vr;
    vr.error  = e;
    vr.reason = reason;
    return vr;
}

VerifyResult verify_signature(const std::string& secret,
                              const std::string& payload,
                              const std::string& claimed)
{
    // 1) text check; nothing below may run on arbitrary bytes
    if (!is_printable_ascii(claimed)) {
        return fail(VerifyError::MalformedSignatureEncoding, "NOT_ASCII");
    }

    // 2) algorithm tag
    if (claimed.size() < kSignaturePrefixLen) {
        return fail(VerifyError::MalformedSignatureEncoding, "TOO_SHORT");
    }
    if (claimed.compare(0, kSignaturePrefixLen, kSignaturePrefix) != 0) {
        return fail(VerifyError::MalformedSignatureEncoding, "BAD_ALGORITHM_TAG");
    }

    // 3) hex digest
    std::string sig_bin;
    if (!hex_to_bytes(claimed.substr(kSignaturePrefixLen), sig_bin)) {
        return fail(VerifyError::InvalidHexEncoding, "BAD_HEX");
    }

    // 4) expected MAC over the raw body
    std::string expected;
    if (!hmac_sha256_bin(secret, payload, expected)) {
        return fail(VerifyError::DigestMismatch, "HMAC_FAIL");
    }

    // 5) constant-time compare; the digest length itself is public
    const bool equal = sig_bin.size() == kDigestLen &&
                       CRYPTO_memcmp(expected.data(), sig_bin.data(), kDigestLen) == 0;
    secure_wipe(expected);
    if (!equal) {
        return fail(VerifyError::DigestMismatch,
                    sig_bin.size() == kDigestLen ? "BAD_SIG" : "BAD_SIG_LENGTH");
    }

    VerifyResult vr;
    vr.ok = true;
    return vr;
}

} // namespace wg::internal
