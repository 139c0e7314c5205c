#include "config/server_config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace syn {

namespace {

int parse_int_env(const char* name, const char* value) {
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return result;
    } catch (const std::exception&) {
        throw std::runtime_error(
            std::string("Invalid integer in environment variable ") + name + ": " + value
        );
    }
}

bool parse_bool_env(const char* name, const char* value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::runtime_error(
        std::string("Invalid boolean in environment variable ") + name + ": " + value
    );
}

} // anonymous namespace

// ============================================================================
// ServerConfig Implementation
// ============================================================================

ServerConfig ServerConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    ServerConfig config;
    config.merge_json(j);
    return config;
}

void ServerConfig::merge_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    try {
        // Listener
        if (j.contains("host")) host = j["host"];
        if (j.contains("port")) port = j["port"];
        if (j.contains("worker_threads")) worker_threads = j["worker_threads"];

        // Requests
        if (j.contains("max_request_bytes")) max_request_bytes = j["max_request_bytes"];
        if (j.contains("read_timeout_seconds")) read_timeout_seconds = j["read_timeout_seconds"];
        if (j.contains("cors_allowed_origin")) cors_allowed_origin = j["cors_allowed_origin"];

        // Client
        if (j.contains("client_base_url")) client_base_url = j["client_base_url"];
        if (j.contains("client_timeout_seconds")) client_timeout_seconds = j["client_timeout_seconds"];

        if (j.contains("verbose")) verbose = j["verbose"];
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }
}

json ServerConfig::to_json() const {
    json j;

    j["host"] = host;
    j["port"] = port;
    j["worker_threads"] = worker_threads;

    j["max_request_bytes"] = max_request_bytes;
    j["read_timeout_seconds"] = read_timeout_seconds;
    j["cors_allowed_origin"] = cors_allowed_origin;

    j["client_base_url"] = client_base_url;
    j["client_timeout_seconds"] = client_timeout_seconds;

    j["verbose"] = verbose;
    return j;
}

void ServerConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file for writing: " + path);
    }
    file << to_json().dump(2);
}

ServerConfig ServerConfig::from_environment() {
    return from_environment(ServerConfig{});
}

ServerConfig ServerConfig::from_environment(const ServerConfig& base) {
    ServerConfig config = base;

    const char* host = std::getenv("SYN_HOST");
    if (host) config.host = host;

    const char* port = std::getenv("SYN_PORT");
    if (port) config.port = parse_int_env("SYN_PORT", port);

    const char* workers = std::getenv("SYN_WORKERS");
    if (workers) config.worker_threads = parse_int_env("SYN_WORKERS", workers);

    const char* verbose = std::getenv("SYN_VERBOSE");
    if (verbose) config.verbose = parse_bool_env("SYN_VERBOSE", verbose);

    const char* server_url = std::getenv("SYN_SERVER_URL");
    if (server_url) config.client_base_url = server_url;

    return config;
}

bool ServerConfig::validate(std::string& error_message) const {
    if (host.empty()) {
        error_message = "Host cannot be empty";
        return false;
    }

    if (port < 0 || port > 65535) {
        error_message = "Port must be between 0 and 65535";
        return false;
    }

    if (worker_threads < 1) {
        error_message = "At least one worker thread is required";
        return false;
    }

    if (max_request_bytes < 1024) {
        error_message = "max_request_bytes must be at least 1024";
        return false;
    }

    if (read_timeout_seconds < 1 || client_timeout_seconds < 1) {
        error_message = "Timeouts must be at least one second";
        return false;
    }

    if (client_base_url.empty()) {
        error_message = "Client base URL cannot be empty";
        return false;
    }

    return true;
}

} // namespace syn
