/*
 * Part of the WebhookGate (WG) project.
 *
 * SPDX-FileCopyrightText: 2025 WebhookGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebhookGate (WG). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "wg/internal/http_parser.hpp"
#include "wg/internal/connection.hpp"

#include <algorithm>
#include <string>
#include <utility>

using namespace wg::internal;

namespace {

// Feeds a fixed byte string in small chunks.
class StringStream : public Stream {
public:
    explicit StringStream(std::string in, std::size_t chunk = 7)
        : _in(std::move(in)), _chunk(chunk) {}

    long read_some(char* buf, std::size_t n) override {
        if (_pos >= _in.size()) return 0;
        std::size_t k = std::min({n, _chunk, _in.size() - _pos});
        std::copy(_in.data() + _pos, _in.data() + _pos + k, buf);
        _pos += k;
        return static_cast<long>(k);
    }
    bool write_all(const char* d, std::size_t n) override {
        out.append(d, n);
        return true;
    }

    std::string out;

private:
    std::string _in;
    std::size_t _chunk;
    std::size_t _pos = 0;
};

} // namespace

TEST(HttpParserTest, RequestLine) {
    wg::HttpRequest r;
    ASSERT_TRUE(parse_request_line("POST /hook?x=1&y=2 HTTP/1.1", r));
    EXPECT_EQ(r.method, "POST");
    EXPECT_EQ(r.path, "/hook");
    EXPECT_EQ(r.query, "x=1&y=2");
    EXPECT_EQ(r.httpver, "HTTP/1.1");
}

TEST(HttpParserTest, RejectsBadRequestLines) {
    wg::HttpRequest r;
    EXPECT_FALSE(parse_request_line("", r));
    EXPECT_FALSE(parse_request_line("GET", r));
    EXPECT_FALSE(parse_request_line("GET /", r));
    EXPECT_FALSE(parse_request_line("GET / FTP/1.0", r));
    EXPECT_FALSE(parse_request_line("GET nopath HTTP/1.1", r));
    EXPECT_FALSE(parse_request_line("GET / HTTP/1.1 extra", r));
}

TEST(HttpParserTest, HeaderNamesAreLowerCasedAndFirstWins) {
    wg::HttpRequest r;
    ASSERT_TRUE(parse_request_head(
        "POST / HTTP/1.1\r\n"
        "Host: example\r\n"
        "X-Hub-Signature-256:  sha256=aa  \r\n"
        "x-hub-signature-256: sha256=bb\r\n", r));
    EXPECT_EQ(r.headers.count("host"), 1u);
    std::string v;
    ASSERT_TRUE(find_header(r, "X-HUB-SIGNATURE-256", v));
    EXPECT_EQ(v, "sha256=aa");
    EXPECT_EQ(hdr_ci(r, "Missing"), "");
}

TEST(HttpParserTest, RejectsFieldWithoutColon) {
    wg::HttpRequest r;
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\nBroken header\r\n", r));
}

TEST(HttpParserTest, ContentLength) {
    std::size_t n = 0;
    EXPECT_TRUE(parse_content_length("0", n));
    EXPECT_EQ(n, 0u);
    EXPECT_TRUE(parse_content_length("32768", n));
    EXPECT_EQ(n, 32768u);
    EXPECT_FALSE(parse_content_length("", n));
    EXPECT_FALSE(parse_content_length("-1", n));
    EXPECT_FALSE(parse_content_length("12abc", n));
    EXPECT_FALSE(parse_content_length("99999999999999999999999", n));
}

TEST(HttpParserTest, ReadsBodyAcrossChunksAndKeepsPipelinedBytes) {
    wg::ServerConfig cfg;
    StringStream s(
        "POST / HTTP/1.1\r\nContent-Length: 13\r\n\r\nHello, World!"
        "GET /health HTTP/1.1\r\n\r\n");

    wg::HttpRequest first;
    ASSERT_EQ(recv_http_request(s, cfg, first), RecvStatus::Ok);
    EXPECT_EQ(first.method, "POST");
    EXPECT_EQ(first.body, "Hello, World!");

    wg::HttpRequest second;
    ASSERT_EQ(recv_http_request(s, cfg, second), RecvStatus::Ok);
    EXPECT_EQ(second.method, "GET");
    EXPECT_EQ(second.path, "/health");
    EXPECT_TRUE(second.body.empty());

    wg::HttpRequest third;
    EXPECT_EQ(recv_http_request(s, cfg, third), RecvStatus::Closed);
}

TEST(HttpParserTest, BodyOverLimitIsRefused) {
    wg::ServerConfig cfg;
    cfg.max_body = 10;
    StringStream s("POST / HTTP/1.1\r\nContent-Length: 11\r\n\r\n01234567890");
    wg::HttpRequest r;
    EXPECT_EQ(recv_http_request(s, cfg, r), RecvStatus::TooLarge);
}

TEST(HttpParserTest, ChunkedIsMalformed) {
    wg::ServerConfig cfg;
    StringStream s("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n0\r\n\r\n");
    wg::HttpRequest r;
    EXPECT_EQ(recv_http_request(s, cfg, r), RecvStatus::Malformed);
}

TEST(HttpParserTest, TruncatedBodyIsClosed) {
    wg::ServerConfig cfg;
    StringStream s("POST / HTTP/1.1\r\nContent-Length: 50\r\n\r\nshort");
    wg::HttpRequest r;
    EXPECT_EQ(recv_http_request(s, cfg, r), RecvStatus::Closed);
}

TEST(HttpParserTest, KeepAliveRules) {
    wg::HttpRequest r;
    r.httpver = "HTTP/1.1";
    EXPECT_TRUE(should_keep_alive(r));
    r.headers["connection"] = "Close";
    EXPECT_FALSE(should_keep_alive(r));

    wg::HttpRequest old;
    old.httpver = "HTTP/1.0";
    EXPECT_FALSE(should_keep_alive(old));
    old.headers["connection"] = "keep-alive";
    EXPECT_TRUE(should_keep_alive(old));
}

TEST(HttpParserTest, ResponseFraming) {
    wg::ServerConfig cfg;
    StringStream s("");
    wg::HttpResponse resp;
    resp.status = 401;
    resp.status_text = "Unauthorized";
    resp.body = R"({"status":"ERROR"})";
    send_http_response(s, cfg, resp, false);
    EXPECT_EQ(s.out,
              "HTTP/1.1 401 Unauthorized\r\n"
              "Content-Type: application/json\r\n"
              "Content-Length: 18\r\n"
              "Connection: close\r\n"
              "\r\n"
              R"({"status":"ERROR"})");
}
