// filename: tests/test_channel_registry.cpp
#include <gtest/gtest.h>
#include "core/channel_registry.hpp"
#include "core/thread_pool.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace {
std::shared_ptr<IdGenerator> seq_ids() {
    return std::make_shared<SequentialIdGenerator>();
}
}

TEST(ChannelRegistry, RequiresIdGenerator) {
    EXPECT_THROW(ChannelRegistry(nullptr), std::invalid_argument);
}

TEST(ChannelRegistry, RegisterTwiceFails) {
    ChannelRegistry reg(seq_ids());
    boost::system::error_code ec;
    reg.register_channel("orders", ec);
    EXPECT_FALSE(ec);

    reg.publish("orders", {{"id", 1}}, ec);
    ASSERT_FALSE(ec);

    reg.register_channel("orders", ec);
    EXPECT_EQ(ec, broker_errc::already_exists);
    EXPECT_EQ(reg.size(), 1u);

    // existing messages survive the failed registration
    auto s = reg.stats("orders", ec);
    ASSERT_FALSE(ec);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->ready, 1u);
}

TEST(ChannelRegistry, MissingChannelIsAnError) {
    ChannelRegistry reg(seq_ids());
    boost::system::error_code ec;

    EXPECT_TRUE(reg.publish("nope", {{"x", 1}}, ec).empty());
    EXPECT_EQ(ec, broker_errc::channel_not_found);

    EXPECT_FALSE(reg.consume("nope", ec).has_value());
    EXPECT_EQ(ec, broker_errc::channel_not_found);

    EXPECT_FALSE(reg.acknowledge("nope", "m1", ec));
    EXPECT_EQ(ec, broker_errc::channel_not_found);

    EXPECT_EQ(reg.purge("nope", ec), 0u);
    EXPECT_EQ(ec, broker_errc::channel_not_found);

    EXPECT_FALSE(reg.stats("nope", ec).has_value());
    EXPECT_EQ(ec, broker_errc::channel_not_found);

    // nothing was created along the way
    EXPECT_EQ(reg.size(), 0u);
}

TEST(ChannelRegistry, ConsumeIsFifo) {
    ChannelRegistry reg(seq_ids());
    boost::system::error_code ec;
    reg.register_channel("q", ec);

    std::vector<std::string> published;
    for (int i = 0; i < 100; ++i) {
        published.push_back(reg.publish("q", {{"i", i}}, ec));
        ASSERT_FALSE(ec);
    }
    for (int i = 0; i < 100; ++i) {
        auto m = reg.consume("q", ec);
        ASSERT_FALSE(ec);
        ASSERT_TRUE(m.has_value());
        EXPECT_EQ(m->id, published[i]);
        EXPECT_EQ(m->payload["i"], i);
    }
    auto empty = reg.consume("q", ec);
    EXPECT_FALSE(ec);
    EXPECT_FALSE(empty.has_value());
}

TEST(ChannelRegistry, ChannelsAreIndependent) {
    ChannelRegistry reg(seq_ids());
    boost::system::error_code ec;
    reg.register_channel("a", ec);
    reg.register_channel("b", ec);

    reg.publish("a", {{"from", "a"}}, ec);
    EXPECT_FALSE(reg.consume("b", ec).has_value());
    EXPECT_FALSE(ec);

    auto m = reg.consume("a", ec);
    ASSERT_TRUE(m.has_value());
    // acknowledging on the wrong channel finds nothing
    EXPECT_FALSE(reg.acknowledge("b", m->id, ec));
    EXPECT_FALSE(ec);
    EXPECT_TRUE(reg.acknowledge("a", m->id, ec));
}

TEST(ChannelRegistry, StatsAfterPartialConsume) {
    ChannelRegistry reg(seq_ids());
    boost::system::error_code ec;
    reg.register_channel("s", ec);

    const std::size_t n = 10;
    const std::size_t k = 4;
    for (std::size_t i = 0; i < n; ++i) reg.publish("s", {{"i", i}}, ec);
    for (std::size_t i = 0; i < k; ++i) reg.consume("s", ec);

    auto s = reg.stats("s", ec);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->ready, n - k);
    EXPECT_EQ(s->unacked, k);
    EXPECT_EQ(s->total(), n);
}

TEST(ChannelRegistry, AcknowledgeOnlyOnce) {
    ChannelRegistry reg(seq_ids());
    boost::system::error_code ec;
    reg.register_channel("c", ec);
    reg.publish("c", {{"x", 1}}, ec);

    auto m = reg.consume("c", ec);
    ASSERT_TRUE(m.has_value());
    EXPECT_TRUE(reg.acknowledge("c", m->id, ec));
    EXPECT_FALSE(ec);
    EXPECT_FALSE(reg.acknowledge("c", m->id, ec));
    EXPECT_FALSE(ec);
    EXPECT_FALSE(reg.acknowledge("c", "never-existed", ec));
    EXPECT_FALSE(ec);
}

TEST(ChannelRegistry, PurgeResetsChannel) {
    ChannelRegistry reg(seq_ids());
    boost::system::error_code ec;
    reg.register_channel("p", ec);
    for (int i = 0; i < 6; ++i) reg.publish("p", {{"i", i}}, ec);
    auto first = reg.consume("p", ec);
    reg.consume("p", ec);
    ASSERT_TRUE(first.has_value());
    reg.acknowledge("p", first->id, ec);

    EXPECT_EQ(reg.purge("p", ec), 5u);
    EXPECT_FALSE(ec);

    auto s = reg.stats("p", ec);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->ready, 0u);
    EXPECT_EQ(s->unacked, 0u);
    EXPECT_EQ(s->total(), 0u);
    EXPECT_FALSE(reg.consume("p", ec).has_value());
    EXPECT_FALSE(ec);

    // the channel itself stays registered
    EXPECT_TRUE(reg.contains("p"));
}

TEST(ChannelRegistry, StatsForAllChannels) {
    ChannelRegistry reg(seq_ids());
    boost::system::error_code ec;
    reg.register_channel("x", ec);
    reg.register_channel("y", ec);
    reg.publish("x", {{"a", 1}}, ec);
    reg.publish("x", {{"a", 2}}, ec);
    reg.consume("x", ec);

    auto all = reg.stats();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all.at("x").ready, 1u);
    EXPECT_EQ(all.at("x").unacked, 1u);
    EXPECT_EQ(all.at("y").total(), 0u);

    auto names = reg.channel_names();
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"x", "y"}));
}

TEST(ChannelRegistry, OrdersScenario) {
    ChannelRegistry reg(seq_ids());
    boost::system::error_code ec;
    reg.register_channel("orders", ec);
    ASSERT_FALSE(ec);

    const std::string m1 = reg.publish("orders", {{"id", 1}}, ec);
    const std::string m2 = reg.publish("orders", {{"id", 2}}, ec);
    EXPECT_EQ(m1, "m1");
    EXPECT_EQ(m2, "m2");

    auto got = reg.consume("orders", ec);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->id, m1);
    EXPECT_EQ(got->payload, (nlohmann::json{{"id", 1}}));

    auto s = reg.stats("orders", ec);
    EXPECT_EQ(s->ready, 1u);
    EXPECT_EQ(s->unacked, 1u);
    EXPECT_EQ(s->total(), 2u);

    EXPECT_TRUE(reg.acknowledge("orders", m1, ec));

    s = reg.stats("orders", ec);
    EXPECT_EQ(s->ready, 1u);
    EXPECT_EQ(s->unacked, 0u);
    EXPECT_EQ(s->total(), 1u);
}

TEST(ChannelRegistry, ConcurrentConsumersNeverShareAMessage) {
    constexpr int N = 20000;
    constexpr int kConsumers = 8;
    ChannelRegistry reg(std::make_shared<UuidIdGenerator>());
    boost::system::error_code ec;
    reg.register_channel("hot", ec);
    for (int i = 0; i < N; ++i) reg.publish("hot", {{"i", i}}, ec);

    std::mutex mu;
    std::vector<std::string> seen;
    seen.reserve(N);
    {
        ThreadPool pool(kConsumers);
        for (int c = 0; c < kConsumers; ++c) {
            pool.post([&] {
                std::vector<std::string> local;
                boost::system::error_code lec;
                while (auto m = reg.consume("hot", lec)) {
                    local.push_back(m->id);
                }
                std::lock_guard<std::mutex> lk(mu);
                seen.insert(seen.end(), local.begin(), local.end());
            });
        }
        pool.wait_idle();
    }

    ASSERT_EQ(seen.size(), static_cast<std::size_t>(N));
    std::set<std::string> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(N));

    auto s = reg.stats("hot", ec);
    EXPECT_EQ(s->ready, 0u);
    EXPECT_EQ(s->unacked, static_cast<std::size_t>(N));
}

TEST(ChannelRegistry, ConcurrentRegisterExactlyOneWins) {
    constexpr int kThreads = 16;
    ChannelRegistry reg(seq_ids());
    std::atomic<int> ok{0};
    std::atomic<int> exists{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            while (!go.load()) std::this_thread::yield();
            boost::system::error_code tec;
            reg.register_channel("x", tec);
            if (!tec) ++ok;
            else if (tec == broker_errc::already_exists) ++exists;
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), 1);
    EXPECT_EQ(exists.load(), kThreads - 1);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(ChannelRegistry, ProducersAndConsumersInterleave) {
    constexpr int kPerProducer = 2000;
    constexpr int kProducers = 4;
    ChannelRegistry reg(std::make_shared<UuidIdGenerator>());
    boost::system::error_code ec;
    reg.register_channel("mix", ec);

    std::atomic<int> consumed{0};
    std::atomic<int> producers_left{kProducers};
    {
        ThreadPool pool(kProducers + 2);
        for (int p = 0; p < kProducers; ++p) {
            pool.post([&, p] {
                boost::system::error_code pec;
                for (int i = 0; i < kPerProducer; ++i) {
                    reg.publish("mix", {{"p", p}, {"i", i}}, pec);
                }
                --producers_left;
            });
        }
        for (int c = 0; c < 2; ++c) {
            pool.post([&] {
                boost::system::error_code cec;
                for (;;) {
                    auto m = reg.consume("mix", cec);
                    if (m) {
                        reg.acknowledge("mix", m->id, cec);
                        ++consumed;
                    } else if (producers_left.load() == 0) {
                        // one more pass after the last producer finished
                        if (!reg.stats("mix", cec)->ready) break;
                    } else {
                        std::this_thread::yield();
                    }
                }
            });
        }
        pool.wait_idle();
    }

    EXPECT_EQ(consumed.load(), kProducers * kPerProducer);
    auto s = reg.stats("mix", ec);
    EXPECT_EQ(s->total(), 0u);
}
