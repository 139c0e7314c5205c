#include <gtest/gtest.h>
#include "server/request_handler.hpp"
#include <nlohmann/json.hpp>

using namespace syn;
using json = nlohmann::json;

class RequestHandlerTest : public ::testing::Test {
protected:
    SynonymIndex index;
    RequestHandler handler{index, "*"};

    HttpResponse send(const std::string& method, const std::string& target,
                      const std::string& body = "",
                      const std::string& content_type = "application/x-www-form-urlencoded") {
        std::string raw = method + " " + target + " HTTP/1.1\r\nHost: test\r\n";
        if (!body.empty()) {
            raw += "Content-Type: " + content_type + "\r\n";
            raw += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        }
        raw += "\r\n" + body;
        return handler.handle(parse_request(raw));
    }
};

// ==========================================
// Add Tests
// ==========================================

TEST_F(RequestHandlerTest, AddWithQueryParams) {
    auto response = send("POST", "/synonyms?words[]=Big&words[]=large&words[]=huge");

    EXPECT_EQ(response.status, 204);
    EXPECT_TRUE(response.body.empty());
    EXPECT_EQ(index.get("big"), (std::set<std::string>{"huge", "large"}));
}

TEST_F(RequestHandlerTest, AddWithFormBody) {
    auto response = send("POST", "/synonyms", "words%5B%5D=fast&words%5B%5D=quick");

    EXPECT_EQ(response.status, 204);
    EXPECT_TRUE(index.are_synonyms("fast", "quick"));
}

TEST_F(RequestHandlerTest, AddWithCommaSeparatedValue) {
    auto response = send("PUT", "/synonyms?words[]=a,b,c");

    EXPECT_EQ(response.status, 204);
    EXPECT_EQ(index.get("a"), (std::set<std::string>{"b", "c"}));
}

TEST_F(RequestHandlerTest, AddSameWordIsBadRequest) {
    auto response = send("POST", "/synonyms?words[]=a&words[]=A");

    EXPECT_EQ(response.status, 400);
    auto body = json::parse(response.body);
    EXPECT_EQ(body["status"], 400);
    EXPECT_EQ(body["error"], "Bad Request");
    EXPECT_EQ(body["message"], "Words contain duplicates");
    EXPECT_EQ(body["path"], "/synonyms");
    EXPECT_TRUE(index.empty());
}

TEST_F(RequestHandlerTest, AddTooFewWordsIsBadRequest) {
    EXPECT_EQ(send("POST", "/synonyms").status, 400);
    EXPECT_EQ(send("POST", "/synonyms?words[]=alone").status, 400);

    auto body = json::parse(send("POST", "/synonyms?words[]=alone").body);
    EXPECT_EQ(body["message"], "At least two words must be passed");
}

TEST_F(RequestHandlerTest, AddDuplicatesIsBadRequest) {
    auto response = send("POST", "/synonyms?words[]=a&words[]=b&words[]=a");
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(json::parse(response.body)["message"], "Words contain duplicates");
}

TEST_F(RequestHandlerTest, AddTrailingCommaIsBadRequest) {
    auto response = send("POST", "/synonyms?words[]=a,b,");
    EXPECT_EQ(response.status, 400);
    EXPECT_TRUE(index.empty());
}

// ==========================================
// Query Tests
// ==========================================

TEST_F(RequestHandlerTest, GetSynonyms) {
    index.add({"car", "automobile", "vehicle"});

    auto response = send("GET", "/synonyms?word=CAR");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.headers["Content-Type"], "application/json");
    EXPECT_EQ(json::parse(response.body), json::array({"automobile", "vehicle"}));
}

TEST_F(RequestHandlerTest, GetUnknownWordIsEmptyArray) {
    auto response = send("GET", "/synonyms?word=nothing");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(json::parse(response.body), json::array());
}

TEST_F(RequestHandlerTest, GetBlankWordIsBadRequest) {
    EXPECT_EQ(send("GET", "/synonyms?word=").status, 400);
    EXPECT_EQ(send("GET", "/synonyms?word=+++").status, 400);

    auto response = send("GET", "/synonyms");
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(json::parse(response.body)["message"], "String cannot be blank");
}

TEST_F(RequestHandlerTest, GetAllGroups) {
    index.add("a", "b");
    index.add("c", "d");

    auto response = send("GET", "/synonyms/all");
    EXPECT_EQ(response.status, 200);
    auto body = json::parse(response.body);
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 2);
    EXPECT_EQ(body[0], json::array({"a", "b"}));
    EXPECT_EQ(body[1], json::array({"c", "d"}));
}

TEST_F(RequestHandlerTest, Statistics) {
    index.add({"a", "b", "c"});

    auto response = send("GET", "/synonyms/stats");
    EXPECT_EQ(response.status, 200);
    auto body = json::parse(response.body);
    EXPECT_EQ(body["num_words"], 3);
    EXPECT_EQ(body["num_groups"], 1);
}

TEST_F(RequestHandlerTest, ClearWithDelete) {
    index.add("a", "b");

    auto response = send("DELETE", "/synonyms/");
    EXPECT_EQ(response.status, 204);
    EXPECT_TRUE(index.empty());
}

// ==========================================
// Routing and CORS Tests
// ==========================================

TEST_F(RequestHandlerTest, UnknownPathIsNotFound) {
    auto response = send("GET", "/words");
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(json::parse(response.body)["status"], 404);
}

TEST_F(RequestHandlerTest, WrongMethodIsNotAllowed) {
    auto response = send("PATCH", "/synonyms");
    EXPECT_EQ(response.status, 405);
    EXPECT_FALSE(response.headers["Allow"].empty());

    EXPECT_EQ(send("DELETE", "/synonyms/all").status, 405);
}

TEST_F(RequestHandlerTest, EveryResponseAllowsOrigin) {
    EXPECT_EQ(send("GET", "/synonyms?word=a").headers["Access-Control-Allow-Origin"], "*");
    EXPECT_EQ(send("GET", "/nope").headers["Access-Control-Allow-Origin"], "*");
    EXPECT_EQ(send("POST", "/synonyms").headers["Access-Control-Allow-Origin"], "*");
}

TEST_F(RequestHandlerTest, PreflightListsMethods) {
    auto response = send("OPTIONS", "/synonyms");
    EXPECT_EQ(response.status, 204);
    EXPECT_EQ(response.headers["Access-Control-Allow-Methods"],
              "HEAD, GET, POST, PUT, PATCH, DELETE");
}

TEST(RequestHandlerOriginTest, ConfiguredOrigin) {
    SynonymIndex index;
    RequestHandler handler(index, "https://example.org");

    auto response = handler.handle(parse_request("GET /synonyms/all HTTP/1.1\r\n\r\n"));
    EXPECT_EQ(response.headers["Access-Control-Allow-Origin"], "https://example.org");
}
