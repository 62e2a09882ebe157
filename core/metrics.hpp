// filename: core/metrics.hpp
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ostream>

struct Metrics {
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> errors{0};
    std::atomic<uint64_t> published{0};
    std::atomic<uint64_t> delivered{0};
    std::atomic<uint64_t> acknowledged{0};
    // messages discarded by purge, ready and unacked alike
    std::atomic<uint64_t> purged{0};
    std::atomic<uint64_t> malformed_requests{0};
};

inline std::ostream& operator<<(std::ostream& os, const Metrics& m) {
    return os << "requests=" << m.requests.load(std::memory_order_relaxed)
              << " errors=" << m.errors.load(std::memory_order_relaxed)
              << " published=" << m.published.load(std::memory_order_relaxed)
              << " delivered=" << m.delivered.load(std::memory_order_relaxed)
              << " acknowledged=" << m.acknowledged.load(std::memory_order_relaxed)
              << " purged=" << m.purged.load(std::memory_order_relaxed)
              << " malformed=" << m.malformed_requests.load(std::memory_order_relaxed);
}

inline uint64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}
