#pragma once

#include "config/server_config.hpp"
#include "index/synonym_index.hpp"
#include "server/request_handler.hpp"
#include "threading/thread_pool.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace syn {

/**
 * @brief Blocking HTTP/1.1 server in front of a SynonymIndex
 *
 * One accept thread hands every connection to a ThreadPool worker. Each
 * connection carries exactly one request and is closed after the response.
 * The index is borrowed and must outlive the server.
 */
class HttpServer {
public:
    HttpServer(SynonymIndex& index, const ServerConfig& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start accepting in the background
     * @throws std::runtime_error if the socket cannot be set up
     */
    void start();

    /**
     * @brief Stop accepting, finish in-flight requests, join threads
     *
     * Safe to call more than once.
     */
    void stop();

    /**
     * @brief Block until the server stops
     *
     * Returns after stop() or after the listening socket fails.
     */
    void wait();

    bool running() const { return running_.load(); }

    /**
     * @brief Port actually bound (differs from config when port 0 was asked)
     */
    int port() const { return bound_port_; }

    size_t requests_served() const { return requests_served_.load(); }

private:
    ServerConfig config_;
    RequestHandler handler_;
    std::unique_ptr<ThreadPool> pool_;

    int listen_fd_ = -1;
    int bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<size_t> requests_served_{0};
    std::thread accept_thread_;

    std::mutex state_mutex_;
    std::condition_variable stopped_cv_;

    int create_listen_socket();
    void accept_loop();

    /**
     * @brief Wake every wait() caller after running_ was cleared
     */
    void notify_stopped();
    void handle_client(int client_fd);

    /**
     * @brief Read one full request (headers and Content-Length body)
     * @return Raw request bytes; empty if the peer sent nothing
     * @throws HttpParseError on oversize or malformed framing
     */
    std::string read_request(int client_fd) const;

    static bool send_all(int fd, const std::string& data);
};

} // namespace syn
