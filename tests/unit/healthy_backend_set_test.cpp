#include "registry/healthy_backend_set.hpp"

#include <gtest/gtest.h>

#include <set>

using dopc::registry::HealthyBackendSet;

TEST(HealthyBackendSetTest, EmptySetHasNoSelection) {
    HealthyBackendSet set;
    auto next = set.SelectNext();
    ASSERT_FALSE(next.IsOk());
    EXPECT_EQ(next.GetStatus().Code(), dopc::common::StatusCode::kUnavailable);
    EXPECT_EQ(next.GetStatus().Message(), "No healthy services available");
}

TEST(HealthyBackendSetTest, AddAndRemoveAreIdempotent) {
    HealthyBackendSet set;
    EXPECT_TRUE(set.Add(8001));
    EXPECT_FALSE(set.Add(8001));
    EXPECT_EQ(set.Size(), 1u);
    EXPECT_TRUE(set.Contains(8001));

    EXPECT_TRUE(set.Remove(8001));
    EXPECT_FALSE(set.Remove(8001));
    EXPECT_FALSE(set.Remove(9999));
    EXPECT_EQ(set.Size(), 0u);
}

TEST(HealthyBackendSetTest, RoundRobinVisitsEachMemberOnce) {
    for (int k = 1; k <= 5; ++k) {
        HealthyBackendSet set;
        for (int i = 0; i < k; ++i) {
            set.Add(8001 + i);
        }
        // 先走几步, 确保从任意游标位置开始都成立
        for (int skip = 0; skip < 3; ++skip) {
            ASSERT_TRUE(set.SelectNext().IsOk());
        }
        std::set<int> seen;
        for (int i = 0; i < k; ++i) {
            auto next = set.SelectNext();
            ASSERT_TRUE(next.IsOk());
            seen.insert(next.Value());
        }
        EXPECT_EQ(seen.size(), static_cast<std::size_t>(k));
    }
}

TEST(HealthyBackendSetTest, CursorSurvivesShrinkingSet) {
    HealthyBackendSet set;
    set.Add(8001);
    set.Add(8002);
    set.Add(8003);
    ASSERT_TRUE(set.SelectNext().IsOk());
    ASSERT_TRUE(set.SelectNext().IsOk());
    set.Remove(8001);
    set.Remove(8002);

    for (int i = 0; i < 3; ++i) {
        auto next = set.SelectNext();
        ASSERT_TRUE(next.IsOk());
        EXPECT_EQ(next.Value(), 8003);
    }
}
