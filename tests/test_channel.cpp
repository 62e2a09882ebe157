// filename: tests/test_channel.cpp
#include <gtest/gtest.h>
#include "core/channel.hpp"

namespace {
Message make(const std::string& id, int n) {
    Message m;
    m.id = id;
    m.payload = {{"n", n}};
    return m;
}
}

TEST(Channel, EmptyPopReturnsNothing) {
    Channel ch("jobs");
    EXPECT_EQ(ch.name(), "jobs");
    EXPECT_FALSE(ch.try_pop().has_value());
    EXPECT_EQ(ch.stats().total(), 0u);
}

TEST(Channel, PopMovesHeadToUnacked) {
    Channel ch("jobs");
    ch.push(make("a", 1));
    ch.push(make("b", 2));

    auto v = ch.try_pop();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->id, "a");
    EXPECT_EQ(v->payload["n"], 1);

    auto s = ch.stats();
    EXPECT_EQ(s.ready, 1u);
    EXPECT_EQ(s.unacked, 1u);
    EXPECT_EQ(s.total(), 2u);
}

TEST(Channel, AckOnlyRemovesDelivered) {
    Channel ch("jobs");
    ch.push(make("a", 1));
    // still ready, not delivered yet
    EXPECT_FALSE(ch.ack("a"));

    ASSERT_TRUE(ch.try_pop().has_value());
    EXPECT_TRUE(ch.ack("a"));
    EXPECT_FALSE(ch.ack("a"));
    EXPECT_EQ(ch.stats().total(), 0u);
}

TEST(Channel, ReturnedMessageIsACopy) {
    Channel ch("jobs");
    ch.push(make("a", 1));
    auto v = ch.try_pop();
    ASSERT_TRUE(v.has_value());
    v->payload["n"] = 99;
    v->id = "mutated";

    // the engine's copy is still acknowledgeable under its own id
    EXPECT_TRUE(ch.ack("a"));
}

TEST(Channel, PurgeDropsReadyAndUnacked) {
    Channel ch("jobs");
    for (int i = 0; i < 5; ++i) ch.push(make("m" + std::to_string(i), i));
    ch.try_pop();
    ch.try_pop();

    EXPECT_EQ(ch.purge(), 5u);
    auto s = ch.stats();
    EXPECT_EQ(s.ready, 0u);
    EXPECT_EQ(s.unacked, 0u);
    EXPECT_FALSE(ch.try_pop().has_value());
    EXPECT_FALSE(ch.ack("m0"));
}
