#include "server/http_message.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace syn {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// Split on "\n", dropping a trailing "\r" from each line
std::vector<std::string> split_lines(const std::string& block) {
    std::vector<std::string> lines;
    std::stringstream ss(block);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

bool is_form_body(const HttpRequest& request) {
    auto type = request.header("Content-Type");
    if (!type) return false;
    std::string lower = *type;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return lower.rfind("application/x-www-form-urlencoded", 0) == 0;
}

} // anonymous namespace

// ============================================================================
// Headers
// ============================================================================

bool HeaderNameLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) <
                   std::tolower(static_cast<unsigned char>(y));
        });
}

// ============================================================================
// HttpRequest
// ============================================================================

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> HttpRequest::params(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& [key, value] : query) {
        if (key == name) values.push_back(value);
    }

    if (!body.empty() && is_form_body(*this)) {
        for (const auto& [key, value] : parse_query(body)) {
            if (key == name) values.push_back(value);
        }
    }
    return values;
}

std::optional<std::string> HttpRequest::param(const std::string& name) const {
    auto values = params(name);
    if (values.empty()) return std::nullopt;
    return values.front();
}

// ============================================================================
// HttpResponse
// ============================================================================

HttpResponse HttpResponse::no_content() {
    HttpResponse response;
    response.status = 204;
    return response;
}

HttpResponse HttpResponse::json(int status, const std::string& body) {
    HttpResponse response;
    response.status = status;
    response.headers["Content-Type"] = "application/json";
    response.body = body;
    return response;
}

std::string HttpResponse::serialize(bool include_body) const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << reason_phrase(status) << "\r\n";
    for (const auto& [name, value] : headers) {
        out << name << ": " << value << "\r\n";
    }
    // 204 and 304 never carry a body
    if (status != 204 && status != 304) {
        out << "Content-Length: " << body.size() << "\r\n";
    }
    out << "Connection: close\r\n";
    out << "\r\n";
    if (include_body && status != 204 && status != 304) {
        out << body;
    }
    return out.str();
}

std::string reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

// ============================================================================
// Parsing
// ============================================================================

std::string url_decode(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%') {
            if (i + 2 >= text.size()) {
                throw HttpParseError("Truncated percent escape in: " + text);
            }
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                throw HttpParseError("Invalid percent escape in: " + text);
            }
            result += static_cast<char>(hi * 16 + lo);
            i += 2;
        } else {
            result += c;
        }
    }

    return result;
}

QueryParams parse_query(const std::string& query) {
    QueryParams params;
    std::stringstream ss(query);
    std::string item;

    while (std::getline(ss, item, '&')) {
        if (item.empty()) continue;
        auto eq_pos = item.find('=');
        if (eq_pos == std::string::npos) {
            params.emplace_back(url_decode(item), "");
        } else {
            params.emplace_back(url_decode(item.substr(0, eq_pos)),
                                url_decode(item.substr(eq_pos + 1)));
        }
    }

    return params;
}

size_t find_header_end(const std::string& data) {
    auto crlf = data.find("\r\n\r\n");
    auto lf = data.find("\n\n");
    if (crlf == std::string::npos && lf == std::string::npos) {
        return std::string::npos;
    }
    if (lf == std::string::npos || (crlf != std::string::npos && crlf < lf)) {
        return crlf + 4;
    }
    return lf + 2;
}

size_t content_length(const std::string& header_block) {
    for (const auto& line : split_lines(header_block)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (iequals(trim(line.substr(0, colon)), "Content-Length")) {
            std::string value = trim(line.substr(colon + 1));
            if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) {
                    return std::isdigit(static_cast<unsigned char>(c)) != 0;
                })) {
                throw HttpParseError("Invalid Content-Length: " + value);
            }
            try {
                return static_cast<size_t>(std::stoull(value));
            } catch (const std::exception&) {
                throw HttpParseError("Invalid Content-Length: " + value);
            }
        }
    }
    return 0;
}

HttpRequest parse_request(const std::string& raw) {
    size_t header_end = find_header_end(raw);
    if (header_end == std::string::npos) {
        throw HttpParseError("Incomplete request headers");
    }

    auto lines = split_lines(raw.substr(0, header_end));
    if (lines.empty() || lines[0].empty()) {
        throw HttpParseError("Missing request line");
    }

    HttpRequest request;

    // Request line: METHOD TARGET VERSION
    std::istringstream request_line(lines[0]);
    std::string extra;
    if (!(request_line >> request.method >> request.target >> request.version) ||
        (request_line >> extra)) {
        throw HttpParseError("Malformed request line: " + lines[0]);
    }
    if (request.version.rfind("HTTP/1.", 0) != 0) {
        throw HttpParseError("Unsupported HTTP version: " + request.version);
    }
    std::transform(request.method.begin(), request.method.end(), request.method.begin(), [](char c) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    });

    // Target: path[?query]
    auto q_pos = request.target.find('?');
    if (q_pos == std::string::npos) {
        request.path = url_decode(request.target);
    } else {
        request.path = url_decode(request.target.substr(0, q_pos));
        request.query = parse_query(request.target.substr(q_pos + 1));
    }
    if (request.path.empty() || request.path[0] != '/') {
        throw HttpParseError("Request target must be an absolute path: " + request.target);
    }

    // Headers
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty()) continue;
        auto colon = lines[i].find(':');
        if (colon == std::string::npos || colon == 0) {
            throw HttpParseError("Malformed header: " + lines[i]);
        }
        request.headers[trim(lines[i].substr(0, colon))] = trim(lines[i].substr(colon + 1));
    }

    // Body
    size_t length = content_length(raw.substr(0, header_end));
    if (raw.size() - header_end < length) {
        throw HttpParseError("Request body shorter than Content-Length");
    }
    request.body = raw.substr(header_end, length);

    return request;
}

} // namespace syn
