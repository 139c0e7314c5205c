#include "server/request_handler.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <cctype>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace syn {

namespace {

const std::string ROOT_PATH = "/synonyms";
const std::string ALL_PATH = "/synonyms/all";
const std::string STATS_PATH = "/synonyms/stats";

// "/synonyms/" and "/synonyms" are the same resource
std::string strip_trailing_slash(const std::string& path) {
    if (path.size() > 1 && path.back() == '/') {
        return path.substr(0, path.size() - 1);
    }
    return path;
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

const char* const RequestHandler::ALLOWED_METHODS = "HEAD, GET, POST, PUT, PATCH, DELETE";

RequestHandler::RequestHandler(SynonymIndex& index, std::string allowed_origin)
    : index_(index), allowed_origin_(std::move(allowed_origin)) {}

HttpResponse RequestHandler::handle(const HttpRequest& request) const {
    HttpResponse response;
    try {
        response = dispatch(request);
    } catch (const std::invalid_argument& e) {
        response = error(400, e.what(), request.path);
    } catch (const HttpParseError& e) {
        response = error(400, e.what(), request.path);
    } catch (const std::exception& e) {
        std::cerr << "[Handler] Unexpected error on " << request.method << " "
                  << request.target << ": " << e.what() << "\n";
        response = error(500, e.what(), request.path);
    }

    response.headers["Access-Control-Allow-Origin"] = allowed_origin_;
    return response;
}

HttpResponse RequestHandler::dispatch(const HttpRequest& request) const {
    const std::string path = strip_trailing_slash(request.path);
    const std::string& method = request.method;

    if (method == "OPTIONS") {
        return preflight();
    }

    if (path == ROOT_PATH) {
        if (method == "POST" || method == "PUT") return add_words(request);
        if (method == "GET" || method == "HEAD") return get_synonyms(request);
        if (method == "DELETE") return clear_index();
        return method_not_allowed(request, "GET, HEAD, POST, PUT, DELETE, OPTIONS");
    }

    if (path == ALL_PATH) {
        if (method == "GET" || method == "HEAD") return get_all_groups();
        return method_not_allowed(request, "GET, HEAD, OPTIONS");
    }

    if (path == STATS_PATH) {
        if (method == "GET" || method == "HEAD") return get_statistics();
        return method_not_allowed(request, "GET, HEAD, OPTIONS");
    }

    return error(404, "No handler for " + request.path, request.path);
}

// ============================================================================
// Routes
// ============================================================================

HttpResponse RequestHandler::add_words(const HttpRequest& request) const {
    auto words = collect_words(request);
    index_.add(words);
    return HttpResponse::no_content();
}

HttpResponse RequestHandler::get_synonyms(const HttpRequest& request) const {
    auto word = request.param("word");
    if (!word || is_blank(*word)) {
        return error(400, "String cannot be blank", request.path);
    }

    json body = index_.get(*word);
    return HttpResponse::json(200, body.dump());
}

HttpResponse RequestHandler::get_all_groups() const {
    return HttpResponse::json(200, index_.to_json()["groups"].dump());
}

HttpResponse RequestHandler::get_statistics() const {
    return HttpResponse::json(200, index_.compute_statistics().to_json().dump());
}

HttpResponse RequestHandler::clear_index() const {
    index_.clear();
    return HttpResponse::no_content();
}

HttpResponse RequestHandler::preflight() const {
    HttpResponse response = HttpResponse::no_content();
    response.headers["Access-Control-Allow-Methods"] = ALLOWED_METHODS;
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";
    response.headers["Access-Control-Max-Age"] = "1800";
    return response;
}

// ============================================================================
// Helpers
// ============================================================================

HttpResponse RequestHandler::error(int status, const std::string& message,
                                   const std::string& path) const {
    json body;
    body["status"] = status;
    body["error"] = reason_phrase(status);
    body["message"] = message;
    body["path"] = path;

    HttpResponse response = HttpResponse::json(status, body.dump());
    response.headers["Access-Control-Allow-Origin"] = allowed_origin_;
    return response;
}

HttpResponse RequestHandler::method_not_allowed(const HttpRequest& request,
                                                const std::string& allow) const {
    HttpResponse response = error(405, "Request method '" + request.method + "' not supported",
                                  request.path);
    response.headers["Allow"] = allow;
    return response;
}

std::vector<std::string> RequestHandler::collect_words(const HttpRequest& request) {
    auto values = request.params("words[]");
    auto plain = request.params("words");
    values.insert(values.end(), plain.begin(), plain.end());

    // A single value may carry a comma separated list: words[]=a,b,c
    std::vector<std::string> words;
    if (values.size() == 1 && values[0].find(',') != std::string::npos) {
        std::stringstream ss(values[0]);
        std::string item;
        while (std::getline(ss, item, ',')) {
            words.push_back(item);
        }
        if (!values[0].empty() && values[0].back() == ',') {
            words.push_back("");
        }
    } else {
        words = std::move(values);
    }
    return words;
}

} // namespace syn
