#include <gtest/gtest.h>
#include "server/http_message.hpp"

using namespace syn;

// ==========================================
// Decoding Tests
// ==========================================

TEST(UrlDecodeTest, EscapesAndPlus) {
    EXPECT_EQ(url_decode("words%5B%5D"), "words[]");
    EXPECT_EQ(url_decode("new+york"), "new york");
    EXPECT_EQ(url_decode("caf%C3%A9"), "caf\xC3\xA9");
    EXPECT_EQ(url_decode("plain"), "plain");
}

TEST(UrlDecodeTest, RejectsBrokenEscapes) {
    EXPECT_THROW(url_decode("abc%2"), HttpParseError);
    EXPECT_THROW(url_decode("abc%zz"), HttpParseError);
}

TEST(ParseQueryTest, RepeatedKeysKeepOrder) {
    auto params = parse_query("words[]=a&words[]=B&x=1&&flag");
    ASSERT_EQ(params.size(), 4);
    EXPECT_EQ(params[0], std::make_pair(std::string("words[]"), std::string("a")));
    EXPECT_EQ(params[1].second, "B");
    EXPECT_EQ(params[2].first, "x");
    EXPECT_EQ(params[3].first, "flag");
    EXPECT_EQ(params[3].second, "");
}

// ==========================================
// Request Parsing Tests
// ==========================================

TEST(ParseRequestTest, GetWithQuery) {
    auto request = parse_request(
        "get /synonyms?word=Big HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "\r\n");

    EXPECT_EQ(request.method, "GET");
    EXPECT_EQ(request.path, "/synonyms");
    EXPECT_EQ(request.target, "/synonyms?word=Big");
    EXPECT_EQ(request.param("word").value_or(""), "Big");
    EXPECT_EQ(request.header("host").value_or(""), "localhost");
    EXPECT_TRUE(request.body.empty());
}

TEST(ParseRequestTest, FormBodyParams) {
    std::string body = "words%5B%5D=a&words%5B%5D=b";
    auto request = parse_request(
        "POST /synonyms?words[]=z HTTP/1.1\r\n"
        "Content-Type: application/x-www-form-urlencoded\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body);

    EXPECT_EQ(request.body, body);
    auto words = request.params("words[]");
    ASSERT_EQ(words.size(), 3);
    EXPECT_EQ(words[0], "z");
    EXPECT_EQ(words[1], "a");
    EXPECT_EQ(words[2], "b");
}

TEST(ParseRequestTest, NonFormBodyIsNotParsed) {
    auto request = parse_request(
        "POST /synonyms HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 9\r\n"
        "\r\n"
        "words[]=a");

    EXPECT_TRUE(request.params("words[]").empty());
}

TEST(ParseRequestTest, BareNewlines) {
    auto request = parse_request("DELETE /synonyms HTTP/1.0\n\n");
    EXPECT_EQ(request.method, "DELETE");
    EXPECT_EQ(request.version, "HTTP/1.0");
}

TEST(ParseRequestTest, NonAsciiMethodBytes) {
    auto request = parse_request("g\xE9t /synonyms HTTP/1.1\r\n\r\n");
    EXPECT_EQ(request.method, "G\xE9T");
}

TEST(ParseRequestTest, FormContentTypeIgnoresCase) {
    auto request = parse_request(
        "POST /synonyms HTTP/1.1\r\n"
        "Content-Type: Application/X-WWW-Form-Urlencoded; charset=UTF-8\r\n"
        "Content-Length: 9\r\n"
        "\r\n"
        "words[]=a");

    ASSERT_EQ(request.params("words[]").size(), 1);
    EXPECT_EQ(request.params("words[]")[0], "a");
}

TEST(ParseRequestTest, MalformedInput) {
    EXPECT_THROW(parse_request("GET /synonyms HTTP/1.1\r\n"), HttpParseError);
    EXPECT_THROW(parse_request("GET\r\n\r\n"), HttpParseError);
    EXPECT_THROW(parse_request("GET synonyms HTTP/1.1\r\n\r\n"), HttpParseError);
    EXPECT_THROW(parse_request("GET / SPDY/3\r\n\r\n"), HttpParseError);
    EXPECT_THROW(parse_request("GET / HTTP/1.1\r\nno-colon\r\n\r\n"), HttpParseError);
    EXPECT_THROW(parse_request("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nshort"), HttpParseError);
    EXPECT_THROW(parse_request("POST / HTTP/1.1\r\nContent-Length: -1\r\n\r\n"), HttpParseError);
}

TEST(FramingTest, HeaderEndAndContentLength) {
    EXPECT_EQ(find_header_end("GET / HTTP/1.1\r\nHost: x\r\n"), std::string::npos);

    std::string head = "GET / HTTP/1.1\r\ncontent-length: 12\r\n\r\n";
    EXPECT_EQ(find_header_end(head + "body"), head.size());
    EXPECT_EQ(content_length(head), 12);
    EXPECT_EQ(content_length("GET / HTTP/1.1\r\n\r\n"), 0);
}

// ==========================================
// Response Tests
// ==========================================

TEST(HttpResponseTest, SerializeJson) {
    auto response = HttpResponse::json(200, "[\"b\"]");
    std::string out = response.serialize();

    EXPECT_EQ(out.rfind("HTTP/1.1 200 OK\r\n", 0), 0);
    EXPECT_NE(out.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(out.find("Content-Length: 5\r\n"), std::string::npos);
    EXPECT_NE(out.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(out.substr(out.size() - 5), "[\"b\"]");
}

TEST(HttpResponseTest, NoContentHasNoBody) {
    std::string out = HttpResponse::no_content().serialize();
    EXPECT_EQ(out.rfind("HTTP/1.1 204 No Content\r\n", 0), 0);
    EXPECT_EQ(out.find("Content-Length"), std::string::npos);
    EXPECT_EQ(out.substr(out.size() - 4), "\r\n\r\n");
}

TEST(HttpResponseTest, HeadKeepsLengthDropsBody) {
    auto response = HttpResponse::json(200, "[]");
    std::string out = response.serialize(false);
    EXPECT_NE(out.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_EQ(out.substr(out.size() - 4), "\r\n\r\n");
}

TEST(HttpResponseTest, ReasonPhrases) {
    EXPECT_EQ(reason_phrase(400), "Bad Request");
    EXPECT_EQ(reason_phrase(405), "Method Not Allowed");
    EXPECT_EQ(reason_phrase(413), "Payload Too Large");
}
