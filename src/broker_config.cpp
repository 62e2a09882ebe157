// filename: src/broker_config.cpp
#include <core/broker_config.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void read_flag(const EnvLookup& env, const char* var, bool& target) {
    const char* v = env(var);
    if (!v) return;
    if (auto f = parse_flag(v)) {
        target = *f;
    } else {
        std::cerr << "[config] ignoring " << var << " (not a boolean): '" << v << "'\n";
    }
}

} // namespace

std::optional<std::uint64_t> parse_positive(std::string_view s) {
    s = trim(s);
    std::uint64_t v = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v, 10);
    if (res.ec != std::errc{} || res.ptr != s.data() + s.size() || v == 0) {
        return std::nullopt;
    }
    return v;
}

std::optional<bool> parse_flag(std::string_view s) {
    const std::string v = lower(trim(s));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

std::size_t default_thread_count() {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw ? hw : 1;
}

BrokerConfig config_from_env(const EnvLookup& env) {
    BrokerConfig cfg;
    const std::size_t hw = default_thread_count();
    const std::size_t max_cap = std::min<std::size_t>(hw * 4, 256);
    cfg.threads = hw;

    if (const char* v = env("BROKER_THREADS")) {
        auto n = parse_positive(v);
        if (!n) {
            std::cerr << "[config] ignoring BROKER_THREADS (not a positive integer): '" << v << "'\n";
        } else if (*n > max_cap) {
            std::cerr << "[config] BROKER_THREADS=" << *n
                      << " too large; clamping to " << max_cap << "\n";
            cfg.threads = max_cap;
        } else {
            cfg.threads = static_cast<std::size_t>(*n);
        }
    }

    if (const char* v = env("BROKER_ID")) {
        const std::string kind = lower(trim(v));
        if (kind == "seq") {
            cfg.id_kind = IdKind::Sequential;
        } else if (kind == "uuid") {
            cfg.id_kind = IdKind::Uuid;
        } else {
            std::cerr << "[config] ignoring BROKER_ID (expected 'uuid' or 'seq'): '" << v << "'\n";
        }
    }

    if (const char* v = env("BROKER_MAX_BODY")) {
        if (auto n = parse_positive(v)) {
            cfg.max_body_bytes = static_cast<std::size_t>(*n);
        } else {
            std::cerr << "[config] ignoring BROKER_MAX_BODY (not a positive integer): '" << v << "'\n";
        }
    }

    read_flag(env, "BROKER_AUTO_CREATE", cfg.policy.auto_create_on_publish);
    read_flag(env, "BROKER_LENIENT", cfg.policy.lenient_missing_channel);
    read_flag(env, "BROKER_VERBOSE", cfg.verbose);
    return cfg;
}
