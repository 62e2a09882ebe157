// filename: tests/test_metrics.cpp
#include <gtest/gtest.h>
#include "core/metrics.hpp"
#include <sstream>
#include <thread>

TEST(Metrics, NowNsMovesForward) {
    const uint64_t a = now_ns();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    const uint64_t b = now_ns();
    EXPECT_GE(b - a, 2000000u);
}

TEST(Metrics, StreamsEveryCounter) {
    Metrics m;
    m.requests = 7;
    m.published = 3;
    m.malformed_requests = 1;
    std::ostringstream os;
    os << m;
    EXPECT_EQ(os.str(), "requests=7 errors=0 published=3 delivered=0 acknowledged=0"
                        " purged=0 malformed=1");
}
