#include "server/price_handler.hpp"
#include "test_http_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>

using dopc::server::HttpRequest;
using dopc::server::PriceHandler;

namespace {

std::map<std::string, std::string> ValidParams() {
    return {
        {"venue_slug", "home-assignment-venue-helsinki"},
        {"cart_value", "1000"},
        {"user_lat", "60.17045"},
        {"user_lon", "24.93147"},
    };
}

HttpRequest Get(const std::string& query) {
    HttpRequest request;
    request.method = "GET";
    request.path = "/api/v1/delivery-order-price";
    request.query = query;
    return request;
}

} // namespace

TEST(PriceHandlerParseTest, AcceptsValidParameters) {
    auto request = PriceHandler::ParseRequest(ValidParams());
    ASSERT_TRUE(request.IsOk()) << request.GetStatus().Message();
    EXPECT_EQ(request.Value().VenueSlug(), "home-assignment-venue-helsinki");
    EXPECT_EQ(request.Value().CartValue(), 1000);
    EXPECT_DOUBLE_EQ(request.Value().UserLat(), 60.17045);
}

TEST(PriceHandlerParseTest, ListsMissingParameters) {
    auto params = ValidParams();
    params.erase("cart_value");
    params.erase("user_lon");
    auto request = PriceHandler::ParseRequest(params);
    ASSERT_FALSE(request.IsOk());
    EXPECT_EQ(request.GetStatus().Message(), "Missing required parameters: cart_value, user_lon");
}

TEST(PriceHandlerParseTest, RejectsMalformedNumbers) {
    auto params = ValidParams();
    params["cart_value"] = "10.5";
    EXPECT_FALSE(PriceHandler::ParseRequest(params).IsOk());

    params = ValidParams();
    params["user_lat"] = "60.1abc";
    EXPECT_FALSE(PriceHandler::ParseRequest(params).IsOk());

    params = ValidParams();
    params["user_lon"] = "nan";
    EXPECT_FALSE(PriceHandler::ParseRequest(params).IsOk());

    params = ValidParams();
    params["cart_value"] = "0";
    auto zero = PriceHandler::ParseRequest(params);
    ASSERT_FALSE(zero.IsOk());
    EXPECT_EQ(zero.GetStatus().Message().rfind("Validation error: ", 0), 0u);
}

TEST(PriceHandlerParseTest, RejectsLatitudeOutOfRange) {
    auto params = ValidParams();
    params["user_lat"] = "95";
    auto request = PriceHandler::ParseRequest(params);
    ASSERT_FALSE(request.IsOk());
    EXPECT_EQ(request.GetStatus().Code(), dopc::common::StatusCode::kInvalidArgument);
    EXPECT_NE(request.GetStatus().Message().find("Invalid latitude"), std::string::npos);
}

TEST(PriceHandlerParseTest, SerializesResponse) {
    auto response = dopc::core::DeliveryPriceResponse::Create(1390, 500, 500, dopc::core::DeliveryDetails{390, 64});
    ASSERT_TRUE(response.IsOk());
    auto json = nlohmann::json::parse(PriceHandler::ToJson(response.Value()));
    EXPECT_EQ(json["total_price"], 1390);
    EXPECT_EQ(json["small_order_surcharge"], 500);
    EXPECT_EQ(json["cart_value"], 500);
    EXPECT_EQ(json["delivery"]["fee"], 390);
    EXPECT_EQ(json["delivery"]["distance"], 64);
}

class PriceHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(api_.Start().IsOk());
        dopc::upstream::PoolOptions options;
        options.connection.host = "127.0.0.1";
        options.connection.port = api_.Port();
        options.pool_size = 1;
        options.health_check_interval = std::chrono::hours(1);
        pool_ = std::make_unique<dopc::upstream::UpstreamConnectionPool>(options);
        service_ = std::make_unique<dopc::core::OrderPriceService>(*pool_, gate_);
        handler_ = std::make_unique<PriceHandler>(*service_);
    }

    void TearDown() override {
        pool_->Stop();
        api_.Stop();
    }

    dopc::test::FakeVenueApi api_;
    dopc::common::AdmissionGate gate_{4};
    std::unique_ptr<dopc::upstream::UpstreamConnectionPool> pool_;
    std::unique_ptr<dopc::core::OrderPriceService> service_;
    std::unique_ptr<PriceHandler> handler_;
};

TEST_F(PriceHandlerTest, InvalidInputNeverReachesUpstream) {
    pool_->Start();
    auto response = handler_->Handle(Get("venue_slug=home-assignment-venue-helsinki&cart_value=1000&user_lat=95&user_lon=24.9"));
    EXPECT_EQ(response.status, 400);
    auto body = nlohmann::json::parse(response.body);
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_EQ(api_.StaticHits(), 0);
    EXPECT_EQ(api_.DynamicHits(), 0);
}

TEST_F(PriceHandlerTest, ReturnsQuote) {
    pool_->Start();
    auto response = handler_->Handle(
        Get("venue_slug=home-assignment-venue-helsinki&cart_value=500&user_lat=60.17045&user_lon=24.93147"));
    ASSERT_EQ(response.status, 200) << response.body;
    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ(body["total_price"], 1390);
    EXPECT_EQ(body["small_order_surcharge"], 500);
}

TEST_F(PriceHandlerTest, PricingRejectionIsBadRequest) {
    pool_->Start();
    auto response = handler_->Handle(
        Get("venue_slug=home-assignment-venue-helsinki&cart_value=1000&user_lat=60.20244&user_lon=24.93087"));
    EXPECT_EQ(response.status, 400);
    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ(body["error"], "No suitable delivery fee range found for distance 3503m");
}

TEST_F(PriceHandlerTest, PoolNotRunningIsBadRequest) {
    auto response = handler_->Handle(
        Get("venue_slug=home-assignment-venue-helsinki&cart_value=1000&user_lat=60.17045&user_lon=24.93147"));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(nlohmann::json::parse(response.body)["error"], "Upstream connection pool is not running");
}

TEST_F(PriceHandlerTest, MaximalCartValueNeverYieldsNegativeTotal) {
    pool_->Start();
    auto response = handler_->Handle(Get(
        "venue_slug=home-assignment-venue-helsinki&cart_value=9223372036854775807&user_lat=60.17045&user_lon=24.93147"));
    EXPECT_EQ(response.status, 400);
    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ(body["error"], "Total price exceeds the representable range");
    EXPECT_FALSE(body.contains("total_price"));
}
