#include "server/http_server.hpp"
#include "server/http_message.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace syn {

namespace {

// How often the accept loop re-checks running_
constexpr int ACCEPT_POLL_MS = 200;

class PayloadTooLarge : public HttpParseError {
public:
    explicit PayloadTooLarge(const std::string& message) : HttpParseError(message) {}
};

class RequestTimeout : public HttpParseError {
public:
    explicit RequestTimeout(const std::string& message) : HttpParseError(message) {}
};

} // anonymous namespace

HttpServer::HttpServer(SynonymIndex& index, const ServerConfig& config)
    : config_(config),
      handler_(index, config.cors_allowed_origin) {}

HttpServer::~HttpServer() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

int HttpServer::create_listen_socket() {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* result = nullptr;
    std::string port_str = std::to_string(config_.port);
    int rc = getaddrinfo(config_.host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0) {
        throw std::runtime_error("Cannot resolve " + config_.host + ": " + gai_strerror(rc));
    }

    int fd = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (fd < 0) {
        freeaddrinfo(result);
        throw std::runtime_error(std::string("socket() failed: ") + std::strerror(errno));
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(fd, result->ai_addr, result->ai_addrlen) < 0) {
        std::string err = std::strerror(errno);
        freeaddrinfo(result);
        close(fd);
        throw std::runtime_error("bind() failed on " + config_.host + ":" + port_str + ": " + err);
    }
    freeaddrinfo(result);

    if (listen(fd, SOMAXCONN) < 0) {
        std::string err = std::strerror(errno);
        close(fd);
        throw std::runtime_error("listen() failed: " + err);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    return fd;
}

void HttpServer::start() {
    if (running_.load()) {
        throw std::runtime_error("Server is already running");
    }

    listen_fd_ = create_listen_socket();
    pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(config_.worker_threads));
    running_.store(true);

    if (config_.verbose) {
        std::cout << "[Server] Listening on " << config_.host << ":" << bound_port_
                  << " (workers=" << config_.worker_threads << ")\n";
    }

    accept_thread_ = std::thread([this]() { accept_loop(); });
}

void HttpServer::stop() {
    bool was_running = running_.exchange(false);

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // Drains queued connections before returning
    pool_.reset();

    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }

    if (was_running && config_.verbose) {
        std::cout << "[Server] Stopped after " << requests_served_.load() << " requests\n";
    }
    notify_stopped();
}

void HttpServer::notify_stopped() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stopped_cv_.notify_all();
}

void HttpServer::wait() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    stopped_cv_.wait(lock, [this]() { return !running_.load(); });
}

// ============================================================================
// Connection handling
// ============================================================================

void HttpServer::accept_loop() {
    while (running_.load()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ready = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready < 0 || (pfd.revents & (POLLERR | POLLNVAL))) {
            std::cerr << "[Server] Listening socket failed: "
                      << (ready < 0 ? std::strerror(errno) : "poll error") << "\n";
            running_.store(false);
            notify_stopped();
            break;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN && running_.load()) {
                std::cerr << "[Server] accept() failed: " << std::strerror(errno) << "\n";
            }
            continue;
        }

        timeval tv{};
        tv.tv_sec = config_.read_timeout_seconds;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        try {
            pool_->enqueue([this, client_fd]() { handle_client(client_fd); });
        } catch (const std::exception& e) {
            std::cerr << "[Server] Rejected connection: " << e.what() << "\n";
            send_all(client_fd, handler_.error(503, e.what(), "").serialize());
            close(client_fd);
        }
    }
}

std::string HttpServer::read_request(int client_fd) const {
    std::string data;
    char buf[4096];
    size_t header_end = std::string::npos;
    size_t expected = 0;

    while (true) {
        if (header_end == std::string::npos) {
            header_end = find_header_end(data);
            if (header_end != std::string::npos) {
                size_t length = content_length(data.substr(0, header_end));
                if (header_end > config_.max_request_bytes ||
                    length > config_.max_request_bytes - header_end) {
                    throw PayloadTooLarge("Request exceeds " +
                                          std::to_string(config_.max_request_bytes) + " bytes");
                }
                expected = header_end + length;
            } else if (data.size() > config_.max_request_bytes) {
                throw PayloadTooLarge("Request headers exceed " +
                                      std::to_string(config_.max_request_bytes) + " bytes");
            }
        }

        if (header_end != std::string::npos && data.size() >= expected) {
            return data.substr(0, expected);
        }

        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw RequestTimeout("Timed out waiting for request");
            }
            throw std::runtime_error(std::string("recv() failed: ") + std::strerror(errno));
        }
        if (n == 0) {
            if (data.empty()) return data;
            throw HttpParseError("Connection closed mid-request");
        }
        data.append(buf, static_cast<size_t>(n));
    }
}

void HttpServer::handle_client(int client_fd) {
    auto start = std::chrono::steady_clock::now();
    HttpResponse response;
    std::string method = "-";
    std::string target = "-";
    bool include_body = true;

    try {
        std::string raw = read_request(client_fd);
        if (raw.empty()) {
            close(client_fd);
            return;
        }

        HttpRequest request = parse_request(raw);
        method = request.method;
        target = request.target;
        include_body = request.method != "HEAD";
        response = handler_.handle(request);
    } catch (const PayloadTooLarge& e) {
        response = handler_.error(413, e.what(), "");
    } catch (const RequestTimeout& e) {
        response = handler_.error(408, e.what(), "");
    } catch (const HttpParseError& e) {
        response = handler_.error(400, e.what(), "");
    } catch (const std::exception& e) {
        std::cerr << "[Server] Exception: " << e.what() << "\n";
        response = handler_.error(500, e.what(), "");
    }

    requests_served_++;
    if (!send_all(client_fd, response.serialize(include_body)) && config_.verbose) {
        std::cerr << "[Server] Client went away before the response was sent\n";
    }
    close(client_fd);

    if (config_.verbose) {
        double ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        std::cout << "[Server] " << method << " " << target << " -> "
                  << response.status << " (" << ms << " ms)\n";
    }
}

bool HttpServer::send_all(int fd, const std::string& data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

} // namespace syn
