#include "client/http_connection.hpp"
#include "server/health_service.h"
#include "server/http_server.hpp"
#include "test_http_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

using dopc::server::HttpRequest;
using dopc::server::HttpResponse;
using dopc::server::HttpServer;

class HttpServerTest : public ::testing::Test {
protected:
    HttpServerTest() : server_(dopc::test::EphemeralServerOptions()) {
        server_.Route(dopc::server::HealthService::kPath, [this](const HttpRequest& request) {
            return health_.Check(request);
        });
        server_.Route("/echo", [](const HttpRequest& request) {
            HttpResponse response;
            response.body = nlohmann::json{{"query", request.query}}.dump();
            return response;
        });
        server_.Route("/boom", [](const HttpRequest&) -> HttpResponse {
            throw std::runtime_error("handler exploded");
        });
    }

    void TearDown() override { server_.Stop(); }

    dopc::client::HttpConnection Connect() {
        dopc::client::ConnectionOptions options;
        options.host = "127.0.0.1";
        options.port = server_.Port();
        options.request_timeout = std::chrono::milliseconds(2000);
        return dopc::client::HttpConnection(options);
    }

    dopc::server::HealthService health_;
    HttpServer server_;
};

TEST_F(HttpServerTest, DispatchUnknownPathIsNotFound) {
    auto response = server_.Dispatch("GET", "/nope");
    EXPECT_EQ(response.status, 404);
}

TEST_F(HttpServerTest, DispatchNonGetIsMethodNotAllowed) {
    auto response = server_.Dispatch("POST", "/echo?a=1");
    EXPECT_EQ(response.status, 405);
    auto body = nlohmann::json::parse(response.body);
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_EQ(body["error"], "Method POST not supported. Only GET requests are allowed.");
}

TEST_F(HttpServerTest, DispatchHandlerExceptionIsInternalError) {
    auto response = server_.Dispatch("GET", "/boom");
    EXPECT_EQ(response.status, 500);
}

TEST_F(HttpServerTest, DispatchPassesRawQuery) {
    auto response = server_.Dispatch("GET", "/echo?venue_slug=a%20b&cart_value=1");
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(nlohmann::json::parse(response.body)["query"], "venue_slug=a%20b&cart_value=1");
}

TEST_F(HttpServerTest, ServesRequestsOverKeepAlive) {
    ASSERT_TRUE(server_.Start().IsOk());
    ASSERT_NE(server_.Port(), 0);

    auto connection = Connect();
    auto health = connection.Get("/health");
    ASSERT_TRUE(health.IsOk()) << health.GetStatus().Message();
    EXPECT_EQ(health.Value().status, 200);
    EXPECT_EQ(nlohmann::json::parse(health.Value().body)["status"], "healthy");
    EXPECT_TRUE(connection.IsOpen());

    // 第二个请求复用同一连接
    auto echo = connection.Get("/echo?x=1");
    ASSERT_TRUE(echo.IsOk()) << echo.GetStatus().Message();
    EXPECT_EQ(nlohmann::json::parse(echo.Value().body)["query"], "x=1");

    auto post = connection.Send(boost::beast::http::verb::post, "/health", "{}");
    ASSERT_TRUE(post.IsOk());
    EXPECT_EQ(post.Value().status, 405);
}

TEST_F(HttpServerTest, BindFailureIsReported) {
    ASSERT_TRUE(server_.Start().IsOk());

    auto options = dopc::test::EphemeralServerOptions();
    options.port = server_.Port();
    HttpServer second(options);
    auto status = second.Start();
    EXPECT_FALSE(status.IsOk());
    EXPECT_EQ(status.Code(), dopc::common::StatusCode::kUnavailable);
}

TEST_F(HttpServerTest, ClientReportsUnreachableServer) {
    ASSERT_TRUE(server_.Start().IsOk());
    auto connection = Connect();
    server_.Stop();

    auto reply = connection.Get("/health");
    ASSERT_FALSE(reply.IsOk());
    EXPECT_EQ(reply.GetStatus().Code(), dopc::common::StatusCode::kUnavailable);
    EXPECT_FALSE(connection.IsOpen());
}
