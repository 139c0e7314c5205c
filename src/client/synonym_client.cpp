#include "client/synonym_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <stdexcept>

using json = nlohmann::json;

namespace syn {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string error_message_from(const std::string& body) {
    try {
        json j = json::parse(body);
        if (j.is_object() && j.contains("message") && j["message"].is_string()) {
            return j["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // not a JSON error body, fall through to the raw text
    }
    return body;
}

} // anonymous namespace

// ============================================================================
// SynonymClient
// ============================================================================

SynonymClient::SynonymClient(std::string base_url, int timeout_seconds)
    : base_url_(std::move(base_url)), timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    if (base_url_.empty()) {
        throw std::invalid_argument("Server URL cannot be empty");
    }
}

ClientResponse SynonymClient::request(
    const std::string& method,
    const std::string& path,
    const std::string& body,
    const std::string& content_type
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string url = base_url_ + path;
    ClientResponse response;
    struct curl_slist* header_list = nullptr;

    if (!content_type.empty()) {
        header_list = curl_slist_append(header_list, ("Content-Type: " + content_type).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (method == "POST" || method == "PUT") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw std::runtime_error("CURL request to " + url + " failed: " + error);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_cleanup(curl);

    return response;
}

void SynonymClient::check_status(const ClientResponse& response, const std::string& what) {
    if (response.status >= 200 && response.status < 300) {
        return;
    }

    std::string message = error_message_from(response.body);
    if (response.status == 400) {
        throw std::invalid_argument(message);
    }
    throw std::runtime_error(
        what + " failed with code " + std::to_string(response.status) + ": " + message
    );
}

std::string SynonymClient::url_encode(const std::string& text) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        throw std::runtime_error("Failed to URL-encode: " + text);
    }

    std::string result(escaped);
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return result;
}

void SynonymClient::add(const std::vector<std::string>& words) {
    std::string form;
    for (const auto& word : words) {
        if (!form.empty()) form += "&";
        form += "words%5B%5D=" + url_encode(word);
    }

    auto response = request("POST", "/synonyms", form, "application/x-www-form-urlencoded");
    check_status(response, "Adding synonyms");
}

std::set<std::string> SynonymClient::get(const std::string& word) {
    auto response = request("GET", "/synonyms?word=" + url_encode(word));
    check_status(response, "Looking up '" + word + "'");

    try {
        return json::parse(response.body).get<std::set<std::string>>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed synonym list: ") + e.what());
    }
}

std::vector<std::set<std::string>> SynonymClient::get_all() {
    auto response = request("GET", "/synonyms/all");
    check_status(response, "Listing synonym groups");

    try {
        return json::parse(response.body).get<std::vector<std::set<std::string>>>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed group list: ") + e.what());
    }
}

json SynonymClient::statistics() {
    auto response = request("GET", "/synonyms/stats");
    check_status(response, "Fetching statistics");

    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed statistics: ") + e.what());
    }
}

void SynonymClient::clear() {
    auto response = request("DELETE", "/synonyms");
    check_status(response, "Clearing dictionary");
}

} // namespace syn
