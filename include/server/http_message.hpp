#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

namespace syn {

/**
 * @brief Raised when a request cannot be parsed as HTTP/1.x
 */
class HttpParseError : public std::runtime_error {
public:
    explicit HttpParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Case-insensitive ordering for header names
 */
struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

// Repeated keys keep their order of appearance
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method;                     // Upper case, e.g. "GET"
    std::string target;                     // Raw request target ("/synonyms?word=a")
    std::string path;                       // Decoded path without the query
    QueryParams query;                      // Decoded query parameters
    std::string version = "HTTP/1.1";
    HeaderMap headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;

    /**
     * @brief All values of a parameter, from the query and a form body
     */
    std::vector<std::string> params(const std::string& name) const;

    /**
     * @brief First value of a parameter, if any
     */
    std::optional<std::string> param(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    HeaderMap headers;
    std::string body;

    static HttpResponse no_content();
    static HttpResponse json(int status, const std::string& body);

    /**
     * @brief Render status line, headers and body
     *
     * Content-Length and Connection: close are always written. HEAD
     * responses keep the headers but drop the body.
     */
    std::string serialize(bool include_body = true) const;
};

/**
 * @brief Standard reason phrase for a status code
 */
std::string reason_phrase(int status);

/**
 * @brief Decode %XX escapes and '+' (as space)
 * @throws HttpParseError on a truncated or non-hex escape
 */
std::string url_decode(const std::string& text);

/**
 * @brief Parse "a=1&b=2&a=3" into ordered, decoded pairs
 */
QueryParams parse_query(const std::string& query);

/**
 * @brief Find the end of the header block ("\r\n\r\n" or "\n\n")
 * @return Offset of the first body byte, or std::string::npos if incomplete
 */
size_t find_header_end(const std::string& data);

/**
 * @brief Value of Content-Length in a raw header block, 0 if absent
 * @throws HttpParseError if the value is not a number
 */
size_t content_length(const std::string& header_block);

/**
 * @brief Parse a complete request (headers and full body)
 * @throws HttpParseError on malformed input
 */
HttpRequest parse_request(const std::string& raw);

} // namespace syn
