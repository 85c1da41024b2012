#include <gtest/gtest.h>

#include "http/http_message.h"

TEST(HttpMessageTest, ParsesRequestHead) {
    const auto req = parse_request_head(
        "POST /android-send?x=1 HTTP/1.1\r\n"
        "Host: 192.168.1.5:40000\r\n"
        "Content-Type: multipart/form-data; boundary=abc\r\n"
        "content-length:  42 \r\n");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->method, "POST");
    EXPECT_EQ(req->target, "/android-send?x=1");
    EXPECT_EQ(req->path(), "/android-send");
    EXPECT_EQ(req->version, "HTTP/1.1");
    EXPECT_EQ(req->header("CONTENT-TYPE"), "multipart/form-data; boundary=abc");
    EXPECT_TRUE(req->has_header("Host"));
    EXPECT_EQ(req->content_length(), 42u);
}

TEST(HttpMessageTest, RejectsMalformedHeads) {
    EXPECT_FALSE(parse_request_head("").has_value());
    EXPECT_FALSE(parse_request_head("GET /\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1 extra\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / FTP/1.0\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\nNoColonHere\r\n").has_value());
}

TEST(HttpMessageTest, ContentLengthValidation) {
    HttpRequest req;
    EXPECT_FALSE(req.content_length().has_value());
    req.headers["content-length"] = "12abc";
    EXPECT_FALSE(req.content_length().has_value());
    req.headers["content-length"] = "-1";
    EXPECT_FALSE(req.content_length().has_value());
    req.headers["content-length"] = "0";
    EXPECT_EQ(req.content_length(), 0u);
}

TEST(HttpMessageTest, SerializesResponse) {
    auto res = HttpResponse::text(404, "No file available");
    const auto wire = res.serialize();

    EXPECT_EQ(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Type: text/plain; charset=utf-8\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 17\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n\r\nNo file available"), std::string::npos);
}

TEST(HttpMessageTest, SetHeaderReplacesCaseInsensitively) {
    HttpResponse res;
    res.set_header("Content-Type", "text/plain");
    res.set_header("content-type", "image/png");
    ASSERT_EQ(res.headers.size(), 1u);
    EXPECT_EQ(res.header("CONTENT-TYPE"), "image/png");
}

TEST(HttpMessageTest, ReasonPhrases) {
    EXPECT_STREQ(reason_phrase(200), "OK");
    EXPECT_STREQ(reason_phrase(400), "Bad Request");
    EXPECT_STREQ(reason_phrase(500), "Internal Server Error");
}
