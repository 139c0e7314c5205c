#include <gtest/gtest.h>
#include "client/synonym_client.hpp"
#include "server/http_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace syn;

namespace {

// Send raw bytes and read until the server closes the connection
std::string raw_exchange(int port, const std::string& data) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return "";
    }

    send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    shutdown(fd, SHUT_WR);

    std::string response;
    char buf[1024];
    ssize_t n;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) {
        response.append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

} // anonymous namespace

class HttpServerTest : public ::testing::Test {
protected:
    SynonymIndex index;
    std::unique_ptr<HttpServer> server;
    std::unique_ptr<SynonymClient> client;

    void SetUp() override {
        ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.worker_threads = 4;
        config.max_request_bytes = 4096;
        config.verbose = false;

        server = std::make_unique<HttpServer>(index, config);
        server->start();
        ASSERT_GT(server->port(), 0);

        client = std::make_unique<SynonymClient>(
            "http://127.0.0.1:" + std::to_string(server->port()) + "/", 5);
    }

    void TearDown() override {
        server->stop();
    }
};

// ==========================================
// Client Round Trips
// ==========================================

TEST_F(HttpServerTest, AddAndGet) {
    client->add({"Happy", "glad", "joyful"});

    EXPECT_EQ(client->get("happy"), (std::set<std::string>{"glad", "joyful"}));
    EXPECT_TRUE(index.are_synonyms("glad", "joyful"));
}

TEST_F(HttpServerTest, WordsNeedingEscapes) {
    client->add({"new york", "big apple", "nyc&co"});

    EXPECT_EQ(client->get("NYC&co"), (std::set<std::string>{"big apple", "new york"}));
}

TEST_F(HttpServerTest, InvalidArgumentCrossesTheWire) {
    try {
        client->add({"same", "SAME"});
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Words contain duplicates");
    }

    EXPECT_THROW(client->get("  "), std::invalid_argument);
    EXPECT_TRUE(index.empty());
}

TEST_F(HttpServerTest, GetAllStatsAndClear) {
    client->add({"a", "b"});
    client->add({"c", "d"});

    auto groups = client->get_all();
    EXPECT_EQ(groups.size(), 2);

    auto stats = client->statistics();
    EXPECT_EQ(stats["num_words"], 4);

    client->clear();
    EXPECT_TRUE(client->get("a").empty());
    EXPECT_TRUE(client->get_all().empty());
}

TEST_F(HttpServerTest, ConcurrentClients) {
    const int thread_count = 8;
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([this, t]() {
            SynonymClient local(client->base_url(), 5);
            for (int i = 0; i < 10; ++i) {
                local.add({"root", "t" + std::to_string(t) + "w" + std::to_string(i)});
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(index.get("root").size(), static_cast<size_t>(thread_count * 10));
    EXPECT_EQ(server->requests_served(), static_cast<size_t>(thread_count * 10));
}

// ==========================================
// Raw Protocol Tests
// ==========================================

TEST_F(HttpServerTest, MalformedRequestIsBadRequest) {
    std::string response = raw_exchange(server->port(), "HELLO\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 400", 0), 0) << response;
}

TEST_F(HttpServerTest, OversizedRequestIsRejected) {
    // Only the headers are sent, the declared length alone exceeds the limit
    std::string request = "POST /synonyms HTTP/1.1\r\nContent-Length: 100000\r\n\r\n";

    std::string response = raw_exchange(server->port(), request);
    EXPECT_EQ(response.rfind("HTTP/1.1 413", 0), 0) << response;
}

TEST_F(HttpServerTest, HugeContentLengthIsRejected) {
    // header_end + length would wrap around size_t
    std::string request = "POST /synonyms HTTP/1.1\r\n"
                          "Content-Length: 18446744073709551615\r\n\r\n";

    std::string response = raw_exchange(server->port(), request);
    EXPECT_EQ(response.rfind("HTTP/1.1 413", 0), 0) << response;
}

TEST_F(HttpServerTest, HeadHasNoBody) {
    index.add("a", "b");
    std::string response = raw_exchange(server->port(), "HEAD /synonyms?word=a HTTP/1.1\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 200", 0), 0) << response;
    EXPECT_EQ(response.substr(response.size() - 4), "\r\n\r\n");
}

TEST_F(HttpServerTest, StopIsIdempotent) {
    server->stop();
    EXPECT_FALSE(server->running());
    server->stop();
    server->wait();
}

TEST_F(HttpServerTest, WaitReturnsOnceStopped) {
    std::thread waiter([this]() { server->wait(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    server->stop();
    waiter.join();

    EXPECT_FALSE(server->running());
    EXPECT_TRUE(raw_exchange(server->port(), "GET /synonyms/all HTTP/1.1\r\n\r\n").empty());
}

TEST(HttpServerStartTest, PortInUseThrows) {
    SynonymIndex index;
    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.verbose = false;

    HttpServer first(index, config);
    first.start();

    config.port = first.port();
    HttpServer second(index, config);
    EXPECT_THROW(second.start(), std::runtime_error);
}
