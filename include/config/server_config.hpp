#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace syn {

// ============================================================================
// Server Configuration
// ============================================================================

/**
 * @brief Configuration for the synonym server and its client
 */
struct ServerConfig {
    // Listener
    std::string host = "0.0.0.0";           ///< Address to bind
    int port = 8080;                        ///< TCP port (0 = pick a free one)
    int worker_threads = 8;                 ///< Request worker threads

    // Requests
    size_t max_request_bytes = 65536;       ///< Max size of headers + body
    int read_timeout_seconds = 10;          ///< Receive timeout on client sockets
    std::string cors_allowed_origin = "*";  ///< Access-Control-Allow-Origin value

    // Client
    std::string client_base_url = "http://localhost:8080";  ///< Server the CLI talks to
    int client_timeout_seconds = 10;        ///< Request timeout for the client

    bool verbose = true;                    ///< Log one line per request

    /**
     * @brief Load configuration from JSON file
     *
     * Keys missing from the file keep their default value.
     */
    static ServerConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;

    /**
     * @brief Apply a parsed JSON object on top of this configuration
     */
    void merge_json(const nlohmann::json& j);

    /**
     * @brief Load from environment variables
     *
     * SYN_HOST, SYN_PORT, SYN_WORKERS, SYN_VERBOSE and SYN_SERVER_URL
     * override the values of @p base.
     */
    static ServerConfig from_environment(const ServerConfig& base);
    static ServerConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

} // namespace syn
