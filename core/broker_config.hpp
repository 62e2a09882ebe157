// filename: core/broker_config.hpp
#pragma once
#include <core/channel_registry.hpp>
#include <core/id_generator.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

constexpr std::size_t kDefaultMaxBodyBytes = 1 * 1024 * 1024;

struct BrokerConfig {
    unsigned short port = 0;
    std::size_t threads = 1;
    IdKind id_kind = IdKind::Uuid;
    RegistryPolicy policy;
    std::size_t max_body_bytes = kDefaultMaxBodyBytes;
    bool verbose = false;
};

// Returns the value of an environment variable, or nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

// Reads BROKER_THREADS, BROKER_ID, BROKER_AUTO_CREATE, BROKER_LENIENT,
// BROKER_MAX_BODY and BROKER_VERBOSE. Malformed values are reported on
// std::cerr and the default is kept.
BrokerConfig config_from_env(const EnvLookup& env);

// Positive decimal integer, surrounding whitespace allowed.
std::optional<std::uint64_t> parse_positive(std::string_view s);

// 1/0, true/false, yes/no, on/off (case-insensitive).
std::optional<bool> parse_flag(std::string_view s);

std::size_t default_thread_count();
