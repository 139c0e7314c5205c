#pragma once

#include <string>
#include <vector>
#include <set>
#include <nlohmann/json.hpp>

namespace syn {

/**
 * @brief Raw result of one HTTP exchange
 */
struct ClientResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief HTTP client for a running synonym server
 *
 * A 400 answer is rethrown as std::invalid_argument with the server's
 * message, so callers see the same error kind as with a local SynonymIndex.
 * Transport errors and any other non-2xx status throw std::runtime_error.
 */
class SynonymClient {
public:
    explicit SynonymClient(std::string base_url, int timeout_seconds = 10);

    void add(const std::vector<std::string>& words);

    std::set<std::string> get(const std::string& word);

    std::vector<std::set<std::string>> get_all();

    nlohmann::json statistics();

    void clear();

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    int timeout_seconds_;

    ClientResponse request(const std::string& method,
                           const std::string& path,
                           const std::string& body = "",
                           const std::string& content_type = "");

    /**
     * @brief Throw the matching exception for a non-2xx response
     */
    static void check_status(const ClientResponse& response, const std::string& what);

    static std::string url_encode(const std::string& text);
};

} // namespace syn
