#include "upstream/upstream_connection_pool.hpp"
#include "test_http_utils.hpp"

#include <gtest/gtest.h>

#include <set>

using dopc::upstream::ConnectionRole;
using dopc::upstream::PoolOptions;
using dopc::upstream::UpstreamConnectionPool;

class UpstreamConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(api_.Start().IsOk()); }
    void TearDown() override { api_.Stop(); }

    PoolOptions Options(std::size_t pool_size) const {
        PoolOptions options;
        options.connection.host = "127.0.0.1";
        options.connection.port = api_.Port();
        options.connection.request_timeout = std::chrono::milliseconds(2000);
        options.pool_size = pool_size;
        // 巡检由测试手动触发
        options.health_check_interval = std::chrono::hours(1);
        return options;
    }

    dopc::test::FakeVenueApi api_;
};

TEST_F(UpstreamConnectionPoolTest, VenuePathEncodesSlug) {
    UpstreamConnectionPool pool(Options(1));
    EXPECT_EQ(pool.VenuePath("home-assignment-venue-helsinki", ConnectionRole::kStatic),
              "/home-assignment-api/v1/venues/home-assignment-venue-helsinki/static");
    EXPECT_EQ(pool.VenuePath("a b", ConnectionRole::kDynamic),
              "/home-assignment-api/v1/venues/a%20b/dynamic");
}

TEST_F(UpstreamConnectionPoolTest, AcquireBeforeStartReturnsNull) {
    UpstreamConnectionPool pool(Options(2));
    EXPECT_EQ(pool.Acquire(ConnectionRole::kStatic), nullptr);
}

TEST_F(UpstreamConnectionPoolTest, RoundRobinCoversEverySlot) {
    constexpr std::size_t kSize = 4;
    UpstreamConnectionPool pool(Options(kSize));
    pool.Start();

    for (auto role : {ConnectionRole::kStatic, ConnectionRole::kDynamic}) {
        std::set<UpstreamConnectionPool::ConnectionPtr> seen;
        for (std::size_t i = 0; i < kSize; ++i) {
            auto connection = pool.Acquire(role);
            ASSERT_NE(connection, nullptr);
            seen.insert(connection);
        }
        EXPECT_EQ(seen.size(), kSize);
        // 再转一圈回到同一批连接
        EXPECT_EQ(seen.count(pool.Acquire(role)), 1u);
    }

    auto static_conn = pool.Acquire(ConnectionRole::kStatic);
    auto dynamic_conn = pool.Acquire(ConnectionRole::kDynamic);
    EXPECT_NE(static_conn, dynamic_conn);
    pool.Stop();
}

TEST_F(UpstreamConnectionPoolTest, HealthySweepKeepsSlots) {
    UpstreamConnectionPool pool(Options(2));
    pool.Start();
    auto before = pool.Acquire(ConnectionRole::kStatic);

    EXPECT_EQ(pool.SweepOnce(), 0u);
    EXPECT_EQ(pool.Replacements(), 0u);
    EXPECT_EQ(api_.StaticHits(), 2);
    EXPECT_EQ(api_.DynamicHits(), 2);

    std::set<UpstreamConnectionPool::ConnectionPtr> slots;
    slots.insert(pool.Acquire(ConnectionRole::kStatic));
    slots.insert(pool.Acquire(ConnectionRole::kStatic));
    EXPECT_EQ(slots.count(before), 1u);
    pool.Stop();
}

TEST_F(UpstreamConnectionPoolTest, FailedProbeReplacesSlot) {
    UpstreamConnectionPool pool(Options(2));
    pool.Start();
    api_.SetStaticStatus(500);

    std::set<UpstreamConnectionPool::ConnectionPtr> before{pool.Acquire(ConnectionRole::kStatic),
                                                           pool.Acquire(ConnectionRole::kStatic)};
    // 进行中的持有者不受替换影响
    auto held = *before.begin();

    EXPECT_EQ(pool.SweepOnce(), 2u);
    EXPECT_EQ(pool.Replacements(), 2u);

    for (int i = 0; i < 2; ++i) {
        EXPECT_EQ(before.count(pool.Acquire(ConnectionRole::kStatic)), 0u);
    }
    EXPECT_NE(held, nullptr);

    api_.SetStaticStatus(200);
    EXPECT_EQ(pool.SweepOnce(), 0u);
    pool.Stop();
}

TEST_F(UpstreamConnectionPoolTest, UnreachableUpstreamIsReplacedNotFatal) {
    auto options = Options(1);
    api_.Stop();
    UpstreamConnectionPool pool(options);
    pool.Start();
    EXPECT_EQ(pool.SweepOnce(), 2u);
    ASSERT_NE(pool.Acquire(ConnectionRole::kDynamic), nullptr);
    pool.Stop();
}

TEST_F(UpstreamConnectionPoolTest, StopIsIdempotent) {
    UpstreamConnectionPool pool(Options(1));
    pool.Start();
    EXPECT_TRUE(pool.Running());
    pool.Stop();
    pool.Stop();
    EXPECT_FALSE(pool.Running());
    EXPECT_EQ(pool.Acquire(ConnectionRole::kStatic), nullptr);
}

TEST_F(UpstreamConnectionPoolTest, BackgroundSweepReplacesFailingSlots) {
    auto options = Options(2);
    options.health_check_interval = std::chrono::milliseconds(50);
    UpstreamConnectionPool pool(options);
    api_.SetDynamicStatus(500);
    pool.Start();

    // 不手动触发, 由巡检线程按固定间隔执行
    EXPECT_TRUE(dopc::test::WaitUntil([&pool]() { return pool.Replacements() >= 4; }));
    EXPECT_GE(api_.DynamicHits(), 4);

    api_.SetDynamicStatus(200);
    auto probes = api_.StaticHits();
    EXPECT_TRUE(dopc::test::WaitUntil([&]() { return api_.StaticHits() >= probes + 4; }));

    auto begin = std::chrono::steady_clock::now();
    pool.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
}

TEST_F(UpstreamConnectionPoolTest, StopInterruptsLongInterval) {
    UpstreamConnectionPool pool(Options(1));
    pool.Start();
    // 启动后立即巡检一次
    EXPECT_TRUE(dopc::test::WaitUntil([this]() { return api_.StaticHits() >= 1 && api_.DynamicHits() >= 1; }));

    auto begin = std::chrono::steady_clock::now();
    pool.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
    EXPECT_FALSE(pool.Running());
}
