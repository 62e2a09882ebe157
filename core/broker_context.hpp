// filename: core/broker_context.hpp
#pragma once
#include "core/metrics.hpp"
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <string>

struct BanEntry {
    std::chrono::steady_clock::time_point until{};
    std::chrono::steady_clock::time_point last_strike{};
    int strikes{0};
};

// Process-wide state shared by the router and every HTTP session.
struct BrokerContext {
    Metrics metrics;

    // log every routed request
    bool verbose = false;

    std::mutex bad_peers_mu;
    std::unordered_map<std::string, BanEntry> bad_peers;

    int bad_request_threshold = 3;
    std::chrono::minutes ban_duration{std::chrono::minutes(5)};

    // Records one malformed request from `ip`. Returns true if that strike
    // got the peer banned.
    bool strike(const std::string& ip) {
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lk(bad_peers_mu);
        prune_locked(now);
        auto& entry = bad_peers[ip];
        entry.last_strike = now;
        entry.strikes++;
        if (entry.strikes >= bad_request_threshold) {
            entry.until = now + ban_duration;
            entry.strikes = 0;
            return true;
        }
        return false;
    }

    bool is_banned(const std::string& ip) {
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lk(bad_peers_mu);
        auto it = bad_peers.find(ip);
        if (it == bad_peers.end()) return false;
        if (it->second.until > now) return true;
        if (expired(it->second, now)) bad_peers.erase(it);
        return false;
    }

private:
    // A ban that has run out, or strikes older than ban_duration that never
    // reached the threshold.
    bool expired(const BanEntry& e, std::chrono::steady_clock::time_point now) const {
        if (e.until != std::chrono::steady_clock::time_point{}) return e.until <= now;
        return e.last_strike + ban_duration <= now;
    }

    void prune_locked(std::chrono::steady_clock::time_point now) {
        for (auto it = bad_peers.begin(); it != bad_peers.end();) {
            if (expired(it->second, now)) it = bad_peers.erase(it);
            else ++it;
        }
    }
};
