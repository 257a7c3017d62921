/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "wg/internal/signature.hpp"
#include "test_utils.hpp"

#include <cctype>
#include <string>

using namespace wg::internal;

namespace {

const std::string kGithubSecret  = "It's a Secret to Everybody";
const std::string kGithubPayload = "Hello, World!";
const std::string kGithubHeader  =
    "sha256=757107ea0eb2509fc211221cce984b8a37570b6d7586c22c46f4379c8b043e17";

} // namespace

TEST(SignatureTest, GithubDocumentationVector) {
    const VerifyResult vr = verify_signature(kGithubSecret, kGithubPayload, kGithubHeader);
    EXPECT_TRUE(vr.ok);
    EXPECT_EQ(vr.error, VerifyError::None);
}

TEST(SignatureTest, SampleDeliveryVector) {
    EXPECT_TRUE(verify_signature(wg::test::kSampleSecret, wg::test::kSampleBody,
                                 wg::test::kSampleHeader).ok);
}

TEST(SignatureTest, MakeHeaderMatchesKnownVector) {
    EXPECT_EQ(make_signature_header(kGithubSecret, kGithubPayload), kGithubHeader);
}

TEST(SignatureTest, UpperCaseHexAccepted) {
    std::string upper = kGithubHeader;
    for (std::size_t i = kSignaturePrefixLen; i < upper.size(); ++i) {
        upper[i] = (char)std::toupper((unsigned char)upper[i]);
    }
    EXPECT_TRUE(verify_signature(kGithubSecret, kGithubPayload, upper).ok);
}

TEST(SignatureTest, EveryChangedHexCharacterFails) {
    for (std::size_t i = kSignaturePrefixLen; i < kGithubHeader.size(); ++i) {
        std::string bad = kGithubHeader;
        bad[i] = (bad[i] == '0') ? '1' : '0';
        const VerifyResult vr = verify_signature(kGithubSecret, kGithubPayload, bad);
        EXPECT_FALSE(vr.ok) << "position " << i;
        EXPECT_EQ(vr.error, VerifyError::DigestMismatch) << "position " << i;
    }
}

TEST(SignatureTest, WrongSecretFails) {
    const std::string header = make_signature_header("another secret", kGithubPayload);
    const VerifyResult vr = verify_signature(kGithubSecret, kGithubPayload, header);
    EXPECT_FALSE(vr.ok);
    EXPECT_EQ(vr.error, VerifyError::DigestMismatch);
}

TEST(SignatureTest, SingleByteMutationOfPayloadFails) {
    for (std::size_t i = 0; i < kGithubPayload.size(); ++i) {
        std::string mutated = kGithubPayload;
        mutated[i] = (char)(mutated[i] ^ 0x01);
        EXPECT_FALSE(verify_signature(kGithubSecret, mutated, kGithubHeader).ok) << "byte " << i;
    }
}

TEST(SignatureTest, PayloadIsHashedVerbatim) {
    // Re-serialized JSON is a different payload.
    EXPECT_FALSE(verify_signature(wg::test::kSampleSecret, R"({"test": 1})",
                                  wg::test::kSampleHeader).ok);
    EXPECT_FALSE(verify_signature(kGithubSecret, kGithubPayload + "\n", kGithubHeader).ok);
}

TEST(SignatureTest, RoundTripWithBinaryPayload) {
    const std::string payload("\x00\x01\xff{\"a\":1}\r\n", 12);
    const std::string header = make_signature_header("k", payload);
    ASSERT_FALSE(header.empty());
    EXPECT_TRUE(verify_signature("k", payload, header).ok);
}

TEST(SignatureTest, EmptyPayload) {
    const std::string header = make_signature_header("secret", "");
    EXPECT_TRUE(verify_signature("secret", "", header).ok);
    EXPECT_FALSE(verify_signature("secret", " ", header).ok);
}

TEST(SignatureTest, ShorterThanPrefixIsMalformed) {
    for (const char* claimed : {"", "s", "sha256", "N/A"}) {
        const VerifyResult vr = verify_signature(kGithubSecret, kGithubPayload, claimed);
        EXPECT_FALSE(vr.ok) << claimed;
        EXPECT_EQ(vr.error, VerifyError::MalformedSignatureEncoding) << claimed;
    }
}

TEST(SignatureTest, PrefixOnlyIsEmptyDigestMismatch) {
    const VerifyResult vr = verify_signature(kGithubSecret, kGithubPayload, "sha256=");
    EXPECT_FALSE(vr.ok);
    EXPECT_EQ(vr.error, VerifyError::DigestMismatch);
}

TEST(SignatureTest, WrongAlgorithmTagIsMalformed) {
    std::string sha1 = "sha1=" + kGithubHeader.substr(kSignaturePrefixLen);
    EXPECT_EQ(verify_signature(kGithubSecret, kGithubPayload, sha1).error,
              VerifyError::MalformedSignatureEncoding);

    std::string upper_tag = "SHA256=" + kGithubHeader.substr(kSignaturePrefixLen);
    EXPECT_EQ(verify_signature(kGithubSecret, kGithubPayload, upper_tag).error,
              VerifyError::MalformedSignatureEncoding);

    EXPECT_EQ(verify_signature(kGithubSecret, kGithubPayload, "Not_A_Match").error,
              VerifyError::MalformedSignatureEncoding);
}

TEST(SignatureTest, NonAsciiIsMalformed) {
    std::string claimed = kGithubHeader;
    claimed[10] = (char)0xC3;
    EXPECT_EQ(verify_signature(kGithubSecret, kGithubPayload, claimed).error,
              VerifyError::MalformedSignatureEncoding);

    // Multi-byte character straddling the prefix boundary.
    EXPECT_EQ(verify_signature(kGithubSecret, kGithubPayload, "sha25\xC3\xA9=00").error,
              VerifyError::MalformedSignatureEncoding);

    std::string with_nul = kGithubHeader;
    with_nul[20] = '\0';
    EXPECT_EQ(verify_signature(kGithubSecret, kGithubPayload, with_nul).error,
              VerifyError::MalformedSignatureEncoding);
}

TEST(SignatureTest, NonHexIsInvalidHexNotMismatch) {
    std::string bad = kGithubHeader;
    bad[bad.size() - 1] = 'g';
    const VerifyResult vr = verify_signature(kGithubSecret, kGithubPayload, bad);
    EXPECT_FALSE(vr.ok);
    EXPECT_EQ(vr.error, VerifyError::InvalidHexEncoding);
}

TEST(SignatureTest, OddLengthHexIsInvalidHex) {
    const VerifyResult vr = verify_signature("Very Secure!", "\"{}\"", "sha256=0123acd");
    EXPECT_FALSE(vr.ok);
    EXPECT_EQ(vr.error, VerifyError::InvalidHexEncoding);
}

TEST(SignatureTest, WrongDigestLengthIsMismatch) {
    // Valid hex, but only the first 16 bytes of the right digest.
    const std::string truncated = kGithubHeader.substr(0, kSignaturePrefixLen + 32);
    const VerifyResult vr = verify_signature(kGithubSecret, kGithubPayload, truncated);
    EXPECT_FALSE(vr.ok);
    EXPECT_EQ(vr.error, VerifyError::DigestMismatch);

    const VerifyResult longer = verify_signature(kGithubSecret, kGithubPayload, kGithubHeader + "00");
    EXPECT_EQ(longer.error, VerifyError::DigestMismatch);
}

TEST(SignatureTest, ErrorNamesAreStable) {
    EXPECT_STREQ(verify_error_name(VerifyError::MalformedSignatureEncoding), "MalformedSignatureEncoding");
    EXPECT_STREQ(verify_error_name(VerifyError::InvalidHexEncoding), "InvalidHexEncoding");
    EXPECT_STREQ(verify_error_name(VerifyError::DigestMismatch), "DigestMismatch");
}

TEST(SignatureTest, ExtractSignatureIsCaseInsensitive) {
    wg::HttpRequest R;
    R.headers["x-hub-signature-256"] = kGithubHeader;
    std::string out;
    ASSERT_TRUE(extract_signature(R, out));
    EXPECT_EQ(out, kGithubHeader);
}

TEST(SignatureTest, ExtractSignatureAbsentVersusEmpty) {
    wg::HttpRequest R;
    std::string out;
    EXPECT_FALSE(extract_signature(R, out));

    R.headers["x-hub-signature-256"] = "";
    EXPECT_TRUE(extract_signature(R, out));
    EXPECT_TRUE(out.empty());
}
