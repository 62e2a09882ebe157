// filename: tests/test_broker_context.cpp
#include <gtest/gtest.h>
#include "core/broker_context.hpp"
#include <string>

TEST(BrokerContext, ThirdStrikeBans) {
    BrokerContext ctx;
    EXPECT_FALSE(ctx.strike("10.0.0.1"));
    EXPECT_FALSE(ctx.strike("10.0.0.1"));
    EXPECT_FALSE(ctx.is_banned("10.0.0.1"));
    EXPECT_TRUE(ctx.strike("10.0.0.1"));
    EXPECT_TRUE(ctx.is_banned("10.0.0.1"));
    EXPECT_FALSE(ctx.is_banned("10.0.0.2"));
}

TEST(BrokerContext, ExpiredBanIsForgotten) {
    BrokerContext ctx;
    ctx.bad_request_threshold = 1;
    ctx.ban_duration = std::chrono::minutes(0);

    EXPECT_TRUE(ctx.strike("10.0.0.1"));
    EXPECT_FALSE(ctx.is_banned("10.0.0.1"));
    EXPECT_TRUE(ctx.bad_peers.empty());
}

TEST(BrokerContext, StalePeersDoNotAccumulate) {
    BrokerContext ctx;
    ctx.ban_duration = std::chrono::minutes(0);

    for (int i = 0; i < 200; ++i) {
        EXPECT_FALSE(ctx.strike("10.0.1." + std::to_string(i)));
    }
    // every older entry is pruned by the next strike
    EXPECT_LE(ctx.bad_peers.size(), 1u);
}
