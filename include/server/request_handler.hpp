#pragma once

#include "index/synonym_index.hpp"
#include "server/http_message.hpp"
#include <string>
#include <vector>

namespace syn {

/**
 * @brief Maps HTTP requests on /synonyms to SynonymIndex operations
 *
 * Routes:
 *   POST|PUT /synonyms?words[]=a&words[]=b   add words as synonyms   -> 204
 *   GET      /synonyms?word=a                synonyms of a word      -> 200 [..]
 *   GET      /synonyms/all                   every synonym group     -> 200 [[..]]
 *   GET      /synonyms/stats                 index statistics        -> 200 {..}
 *   DELETE   /synonyms                       clear the dictionary    -> 204
 *   OPTIONS  any                             CORS preflight          -> 204
 *
 * std::invalid_argument from the index becomes 400 with its message.
 * The handler never throws; unexpected errors become 500.
 */
class RequestHandler {
public:
    RequestHandler(SynonymIndex& index, std::string allowed_origin = "*");

    HttpResponse handle(const HttpRequest& request) const;

    /**
     * @brief Build a JSON error response for a status and message
     */
    HttpResponse error(int status, const std::string& message, const std::string& path) const;

    static const char* const ALLOWED_METHODS;

private:
    SynonymIndex& index_;
    std::string allowed_origin_;

    HttpResponse dispatch(const HttpRequest& request) const;

    HttpResponse add_words(const HttpRequest& request) const;
    HttpResponse get_synonyms(const HttpRequest& request) const;
    HttpResponse get_all_groups() const;
    HttpResponse get_statistics() const;
    HttpResponse clear_index() const;
    HttpResponse preflight() const;

    HttpResponse method_not_allowed(const HttpRequest& request, const std::string& allow) const;

    /**
     * @brief Collect the words[] (or words) parameter, splitting comma lists
     */
    static std::vector<std::string> collect_words(const HttpRequest& request);
};

} // namespace syn
