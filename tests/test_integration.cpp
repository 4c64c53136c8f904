/// @file test_integration.cpp
/// Integration tests over loopback. A stub of the remote todo API is served
/// by HttpServer on an ephemeral port, so no external network is needed.

#include "combined_handler.hpp"
#include "data_provider.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "http_server.hpp"
#include "product_service.hpp"
#include "remote_fetcher.hpp"
#include "router.hpp"

#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

using namespace combined_api;
using json = nlohmann::json;
namespace http = boost::beast::http;
using namespace std::chrono_literals;

namespace {

const std::string kLoopback = "127.0.0.1";

std::string baseUrlFor(const HttpServer& server, const std::string& path = "") {
    return "http://" + kLoopback + ":" + std::to_string(server.port()) + path;
}

json stubTodo(int id) {
    if (id == 1) {
        return {{"userId", 1}, {"id", 1},
                {"title", "delectus aut autem"}, {"completed", false}};
    }
    return {{"userId", (id + 9) / 10}, {"id", id},
            {"title", "todo " + std::to_string(id)}, {"completed", id % 2 == 0}};
}

} // namespace

// ---------------------------------------------------------------------------
// Stub remote API: /todos/{id} returns a todo, /todos/404 a 404,
// /todos/500 a 500, /todos/999 a malformed body.
// ---------------------------------------------------------------------------

class IntegrationTest : public ::testing::Test {
protected:
    std::atomic<int>            stubRequests{0};
    std::atomic<int>            stubDelayMs{0};
    std::unique_ptr<HttpServer> stub;

    void SetUp() override {
        stub = std::make_unique<HttpServer>(
            kLoopback, 0,
            [this](const HttpRequest& req) { return serveStub(req); },
            /*threads=*/4);
        stub->start();
    }

    void TearDown() override {
        stub->stop();
    }

    HttpResponse serveStub(const HttpRequest& req) {
        ++stubRequests;
        std::this_thread::sleep_for(std::chrono::milliseconds(stubDelayMs.load()));

        const std::string target(req.target());
        if (target == "/echo-host") {
            json body = {{"host", std::string(req[http::field::host])}};
            return makeJsonResponse(req, 200, body.dump());
        }

        const std::string prefix = "/todos/";
        if (target.compare(0, prefix.size(), prefix) != 0) {
            return makeJsonResponse(req, 404, "{}");
        }

        const int id = std::stoi(target.substr(prefix.size()));
        if (id == 404) {
            return makeJsonResponse(req, 404, "{}");
        }
        if (id == 500) {
            return makeJsonResponse(req, 500, R"({"error":"boom"})");
        }
        if (id == 999) {
            return makeJsonResponse(req, 200, "{\"id\": 999, \"title\":");
        }
        return makeJsonResponse(req, 200, stubTodo(id).dump());
    }

    std::shared_ptr<const HttpClient> makeClient(int timeoutMs = 2000) {
        return std::make_shared<HttpClient>(baseUrlFor(*stub), timeoutMs);
    }
};

// ============================================================================
// HttpClient
// ============================================================================

TEST_F(IntegrationTest, ClientGetsStatusAndBody) {
    HttpClient client(baseUrlFor(*stub), 2000);

    auto resp = client.get("todos/1");
    EXPECT_EQ(resp.httpStatus, 200u);
    EXPECT_EQ(json::parse(resp.body), stubTodo(1));
}

TEST_F(IntegrationTest, ClientReturnsNon2xxWithoutThrowing) {
    HttpClient client(baseUrlFor(*stub), 2000);

    auto resp = client.get("todos/500");
    EXPECT_EQ(resp.httpStatus, 500u);
}

TEST_F(IntegrationTest, ClientPrefixesBasePath) {
    HttpClient client(baseUrlFor(*stub, "/api/"), 2000);
    EXPECT_EQ(client.targetFor("todos/3"), "/api/todos/3");

    // The stub only knows /todos/..., so the prefixed target is a 404.
    EXPECT_EQ(client.get("todos/3").httpStatus, 404u);
}

TEST_F(IntegrationTest, ClientSendsPortInHostHeader) {
    HttpClient client(baseUrlFor(*stub), 2000);

    auto resp = client.get("echo-host");
    ASSERT_EQ(resp.httpStatus, 200u);
    EXPECT_EQ(json::parse(resp.body)["host"],
              kLoopback + ":" + std::to_string(stub->port()));
}

TEST(HttpClientHostHeader, OmitsDefaultPort) {
    EXPECT_EQ(HttpClient("http://example.com/api").hostHeader(), "example.com");
    EXPECT_EQ(HttpClient("http://example.com:80").hostHeader(), "example.com");
    EXPECT_EQ(HttpClient("http://example.com:8080").hostHeader(),
              "example.com:8080");
}

TEST_F(IntegrationTest, ClientTimesOut) {
    stubDelayMs = 600;
    HttpClient client(baseUrlFor(*stub), /*timeoutMs=*/100);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.get("todos/1"), std::runtime_error);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_LT(ms, 500);
}

TEST(HttpClientTimeout, ConnectIsBounded) {
    // 10.255.255.1 is not routable: the SYN is dropped or rejected, either
    // way the call must give up within the configured timeout.
    HttpClient client("http://10.255.255.1:81", /*timeoutMs=*/300);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.get("todos/1"), std::runtime_error);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_LT(ms, 2000);
}

// ============================================================================
// RemoteFetcher
// ============================================================================

TEST_F(IntegrationTest, FetcherParsesTodo) {
    RemoteFetcher fetcher(makeClient());

    auto todo = fetcher.fetchRemoteItem(1);
    EXPECT_EQ(todo.id, 1);
    EXPECT_EQ(todo.ownerId, 1);
    EXPECT_EQ(todo.title, "delectus aut autem");
    EXPECT_FALSE(todo.completed);
}

TEST_F(IntegrationTest, FetcherRejectsNotFound) {
    RemoteFetcher fetcher(makeClient());
    EXPECT_THROW(fetcher.fetchRemoteItem(404), RemoteFetchError);
}

TEST_F(IntegrationTest, FetcherRejectsServerError) {
    RemoteFetcher fetcher(makeClient());
    EXPECT_THROW(fetcher.fetchRemoteItem(500), RemoteFetchError);
}

TEST_F(IntegrationTest, FetcherRejectsMalformedBody) {
    RemoteFetcher fetcher(makeClient());
    EXPECT_THROW(fetcher.fetchRemoteItem(999), RemoteFetchError);
}

TEST_F(IntegrationTest, FetcherReportsConnectionFailure) {
    std::string deadBase;
    {
        HttpServer closed(kLoopback, 0, [](const HttpRequest& req) {
            return makeJsonResponse(req, 200, "{}");
        });
        deadBase = baseUrlFor(closed);
    }

    RemoteFetcher fetcher(std::make_shared<HttpClient>(deadBase, 1000));
    EXPECT_THROW(fetcher.fetchRemoteItem(1), RemoteFetchError);
}

TEST_F(IntegrationTest, FetcherMakesOneRequestPerCall) {
    RemoteFetcher fetcher(makeClient());

    fetcher.fetchRemoteItem(2);
    fetcher.fetchRemoteItem(3);
    EXPECT_EQ(stubRequests.load(), 2);
}

// ============================================================================
// Full stack
// ============================================================================

class FullStackTest : public IntegrationTest {
protected:
    std::unique_ptr<DefaultProductService> service;
    std::unique_ptr<CombinedHandler>       handler;
    std::unique_ptr<Router>                router;
    std::unique_ptr<HttpServer>            server;

    void SetUp() override {
        IntegrationTest::SetUp();

        service = std::make_unique<DefaultProductService>(
            DataProvider(300ms), RemoteFetcher(makeClient()));
        handler = std::make_unique<CombinedHandler>(*service);
        router  = std::make_unique<Router>(*handler);
        server  = std::make_unique<HttpServer>(
            kLoopback, 0,
            [this](const HttpRequest& req) { return router->route(req); },
            /*threads=*/4);
        server->start();
    }

    void TearDown() override {
        server->stop();
        IntegrationTest::TearDown();
    }
};

TEST_F(FullStackTest, HandlerMatchesReferenceScenario) {
    auto result = handler->handle(1);

    EXPECT_EQ(result.product.id, 1);
    EXPECT_EQ(result.product.name, "Product 1");
    EXPECT_DOUBLE_EQ(result.product.price, 49.99);
    EXPECT_EQ(result.todo.id, 1);
    EXPECT_EQ(result.todo.ownerId, 1);
    EXPECT_EQ(result.todo.title, "delectus aut autem");
    EXPECT_FALSE(result.todo.completed);
    EXPECT_EQ(result.message,
              "This is an example of async/await that keeps the server responsive.");
}

TEST_F(FullStackTest, ServesCombinedEndpoint) {
    HttpClient client(baseUrlFor(*server), 5000);

    auto resp = client.get("combined/1");
    ASSERT_EQ(resp.httpStatus, 200u);

    json expected = {
        {"product", {{"id", 1}, {"name", "Product 1"}, {"price", 49.99}}},
        {"todo", {{"id", 1}, {"userId", 1},
                  {"title", "delectus aut autem"}, {"completed", false}}},
        {"message",
         "This is an example of async/await that keeps the server responsive."}
    };
    EXPECT_EQ(json::parse(resp.body), expected);
}

TEST_F(FullStackTest, RemoteFailureIs502) {
    HttpClient client(baseUrlFor(*server), 5000);

    auto resp = client.get("combined/500");
    EXPECT_EQ(resp.httpStatus, 502u);
    EXPECT_EQ(json::parse(resp.body)["error"], "Upstream request failed");
}

TEST_F(FullStackTest, OverlapsStoreAndRemoteLatency) {
    stubDelayMs = 300;
    HttpClient client(baseUrlFor(*server), 5000);

    auto start = std::chrono::steady_clock::now();
    auto resp  = client.get("combined/2");
    auto ms    = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_EQ(resp.httpStatus, 200u);
    EXPECT_GE(ms, 300);
    EXPECT_LT(ms, 300 + 300 - 50) << "Store and remote latency did not overlap";
}

TEST_F(FullStackTest, ConcurrentRequestsShareOneClient) {
    HttpClient client(baseUrlFor(*server), 5000);

    auto first  = std::async(std::launch::async, [&client] {
        return client.get("combined/1");
    });
    auto second = std::async(std::launch::async, [&client] {
        return client.get("combined/2");
    });

    auto a = json::parse(first.get().body);
    auto b = json::parse(second.get().body);

    EXPECT_EQ(a["product"]["id"], 1);
    EXPECT_EQ(a["todo"]["id"], 1);
    EXPECT_EQ(b["product"]["id"], 2);
    EXPECT_EQ(b["todo"]["id"], 2);
    EXPECT_EQ(stubRequests.load(), 2);
}
